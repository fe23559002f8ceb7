#pragma once

#include <archlens/interfaces.h>

namespace archlens {

// Derives inheritance, field and usage edges from one type's metadata.
class BytecodeRelationshipExtractor : public RelationshipExtractor {
public:
  ExtractionResult Extract(const TypeMetadata &type,
                           const SymbolTable &symbols) const override;
};

TypeNode MakeTypeNode(const TypeMetadata &type);

std::size_t EstimateSize(std::size_t method_count, std::size_t field_count);

EdgeKind ClassifyField(const TypeMetadata &owner, const FieldMetadata &field,
                       const SymbolTable &symbols);

} // namespace archlens
