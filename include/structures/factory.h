#pragma once
#include <memory>
#include <string>
#include <vector>

#include "rmq_structure.h"

enum class StructureType { NAIVE, SQRT_DECOMPOSITION, SEGMENT_TREE, SPARSE_TABLE };

std::unique_ptr<RmqStructure> create_structure(StructureType type, std::vector<double> values);

// Throws InvalidTypeError for a non-numeric sequence, EmptyInputError for an empty one
std::unique_ptr<RmqStructure> create_structure_from_cells(StructureType type, const std::vector<Cell> &cells);

std::string structure_name(StructureType type);

const std::vector<StructureType> &all_structure_types();
