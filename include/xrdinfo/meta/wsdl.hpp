#pragma once

#include <xrdinfo/core/result.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace xrdinfo {

struct WsdlOperation {
    std::string name;
    std::string version;  // empty when the operation has no xrd:version

    bool operator==(const WsdlOperation& other) const {
        return name == other.name && version == other.version;
    }
};

/// Operations declared under wsdl:binding, in document order. Operations
/// without a name attribute are skipped.
Result<std::vector<WsdlOperation>, Error> ListWsdlOperations(std::string_view wsdl);

} // namespace xrdinfo
