#include <xrdinfo/meta/wsdl.hpp>

#include "../xml/xml_utils.hpp"

#include <tinyxml2.h>

namespace xrdinfo {

namespace {

using xml_utils::ChildrenByLocalName;
using xml_utils::FirstChildByLocalName;
using xml_utils::HasLocalName;

// Bindings may sit directly under definitions or, in WSDL 1.1 documents
// produced by some toolkits, one level deeper.
void CollectBindings(const tinyxml2::XMLElement* element,
                     std::vector<const tinyxml2::XMLElement*>& out) {
    for (auto* child = element->FirstChildElement(); child != nullptr;
         child = child->NextSiblingElement()) {
        if (HasLocalName(child, "binding")) {
            out.push_back(child);
        } else {
            CollectBindings(child, out);
        }
    }
}

} // anonymous namespace

Result<std::vector<WsdlOperation>, Error> ListWsdlOperations(std::string_view wsdl) {
    tinyxml2::XMLDocument doc;
    if (auto err = xml_utils::ParseXmlOrError(doc, wsdl, "ListWsdlOperations", "",
                                              "Failed to parse WSDL")) {
        return Result<std::vector<WsdlOperation>, Error>::Err(std::move(*err));
    }
    auto* root = doc.RootElement();
    if (root == nullptr) {
        return Result<std::vector<WsdlOperation>, Error>::Err(
            Error{"ListWsdlOperations", "", std::nullopt, "WSDL document is empty",
                  std::nullopt, ErrorCategory::Format});
    }

    std::vector<const tinyxml2::XMLElement*> bindings;
    CollectBindings(root, bindings);

    std::vector<WsdlOperation> operations;
    for (auto* binding : bindings) {
        for (auto* operation : ChildrenByLocalName(binding, "operation")) {
            const char* name = operation->Attribute("name");
            if (name == nullptr) {
                continue;
            }
            std::string version;
            if (auto* version_el = FirstChildByLocalName(operation, "version");
                version_el != nullptr && version_el->GetText() != nullptr) {
                version = version_el->GetText();
            }
            operations.push_back(WsdlOperation{name, std::move(version)});
        }
    }
    return Result<std::vector<WsdlOperation>, Error>::Ok(std::move(operations));
}

} // namespace xrdinfo
