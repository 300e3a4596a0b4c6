#include "net/ip_error.hpp"

namespace ipam::net {

const char* to_string(ip_error error)
{
    switch (error) {
    case ip_error::invalid_ip_version:
        return ("invalid IP version");
    case ip_error::invalid_ip_format:
        return ("invalid IP address format");
    case ip_error::invalid_cidr_format:
        return ("invalid CIDR format");
    default:
        return ("unknown IP error");
    }
}

} // namespace ipam::net
