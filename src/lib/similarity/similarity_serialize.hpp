#ifndef SIMILARITY_SIMILARITYSERIALIZE_HPP
#define SIMILARITY_SIMILARITYSERIALIZE_HPP

#include <iostream>

#include "similarity/similarity.hpp"

// This namespace groups the functions used to serialize Similarity data
// structures into a binary stream.
namespace Similarity::Serialize {

bool read_metric(std::istream &stream, Similarity::Metric *metric);
bool write_metric(std::ostream &stream, Similarity::Metric metric);

// Read/Write a single score to/from the given binary stream.
bool read_score(std::istream &stream, Similarity::Score *score);
bool write_score(std::ostream &stream, const Similarity::Score &score);

// Read/Write all scores to/from the given binary stream.
bool read_scores(std::istream &stream, std::vector<Similarity::Score> *scores);
bool write_scores(std::ostream &stream,
                  const std::vector<Similarity::Score> &scores);

}  // namespace Similarity::Serialize

#endif /* SIMILARITY_SIMILARITYSERIALIZE_HPP */
