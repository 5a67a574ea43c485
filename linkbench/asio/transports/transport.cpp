#include "transport.hpp"

namespace linkbench::asio {

    transport::transport(const std::string& context)
        : context_(context) {
    }

    transport::~transport() = default;

}
