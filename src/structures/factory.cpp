#include "structures/factory.h"
#include "structures/naive.h"
#include "structures/segment_tree.h"
#include "structures/sparse_table.h"
#include "structures/sqrt_decomposition.h"
#include <stdexcept>
#include <utility>

std::unique_ptr<RmqStructure> create_structure(StructureType type, std::vector<double> values) {
    switch (type) {
        case StructureType::NAIVE: return std::make_unique<NaiveRmq>(std::move(values));
        case StructureType::SQRT_DECOMPOSITION: return std::make_unique<SqrtDecomposition>(std::move(values));
        case StructureType::SEGMENT_TREE: return std::make_unique<SegmentTree>(std::move(values));
        case StructureType::SPARSE_TABLE: return std::make_unique<SparseTable>(std::move(values));
        default: throw std::invalid_argument("Unsupported structure type");
    }
}

std::unique_ptr<RmqStructure> create_structure_from_cells(StructureType type, const std::vector<Cell> &cells) {
    return create_structure(type, numeric_sequence(cells));
}

std::string structure_name(StructureType type) {
    switch (type) {
        case StructureType::NAIVE: return "Naive";
        case StructureType::SQRT_DECOMPOSITION: return "SqrtDecomposition";
        case StructureType::SEGMENT_TREE: return "SegmentTree";
        case StructureType::SPARSE_TABLE: return "SparseTable";
        default: throw std::invalid_argument("Unsupported structure type");
    }
}

const std::vector<StructureType> &all_structure_types() {
    static const std::vector<StructureType> types = {
        StructureType::NAIVE,
        StructureType::SQRT_DECOMPOSITION,
        StructureType::SEGMENT_TREE,
        StructureType::SPARSE_TABLE
    };
    return types;
}
