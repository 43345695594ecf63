#ifndef BATCH_BATCHSERIALIZE_HPP
#define BATCH_BATCHSERIALIZE_HPP

#include <iostream>

#include "batch/batch.hpp"

// This namespace groups the functions used to serialize batch comparison
// reports into a binary stream.
namespace Batch::Serialize {

// Read/Write a single cell to/from the given binary stream. The outcome is
// stored as a tag byte followed by the score or the failure reason.
bool read_cell(std::istream &stream, Batch::Cell *cell);
bool write_cell(std::ostream &stream, const Batch::Cell &cell);

// Read/Write the full report to/from the given binary stream. Reading fails if
// the number of cells does not match the number of queries and candidates.
bool read_report(std::istream &stream, Batch::Report *report);
bool write_report(std::ostream &stream, const Batch::Report &report);

}  // namespace Batch::Serialize

#endif /* BATCH_BATCHSERIALIZE_HPP */
