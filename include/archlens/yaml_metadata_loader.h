#pragma once

#include <archlens/interfaces.h>

#include <filesystem>
#include <string>
#include <vector>

namespace archlens {

// Reads compiled-unit metadata exported as YAML:
//
//   types:
//     - name: com.shop.OrderService
//       kind: class
//       superclass: com.shop.BaseService
//       fields:
//         - {name: repository, type: com.shop.OrderRepository}
//       methods:
//         - name: <init>
//           parameters: [com.shop.OrderRepository]
//           instructions:
//             - {op: field_write, target: com.shop.OrderService, member: repository}
class YamlMetadataLoader : public MetadataLoader {
public:
  std::vector<TypeMetadata> Load(const std::filesystem::path &path) override;
};

std::vector<TypeMetadata> ParseMetadata(const std::string &yaml_text);

OpCategory ParseOpCategory(const std::string &value);
TypeKind ParseTypeKind(const std::string &value);

} // namespace archlens
