#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "ratinggraph_preprocess/mapping/id_mapper.h"
#include "ratinggraph_preprocess/split/rating_edges.h"

namespace ratinggraph::dataloaders {

// Ratings keyed by raw identifiers, in file order.
struct RawRatings {
  std::vector<int64_t> users;
  std::vector<int64_t> items;
  std::vector<double> ratings;

  size_t size() const { return ratings.size(); }
  void Append(const RawRatings& other);
  RawRatings Select(const std::vector<size_t>& rows) const;
};

// `user item rating timestamp`, tab separated, no header (u.data, u1.base, u1.test).
RawRatings ReadTabRatings(const std::string& path);

// `user::item::rating::timestamp` (ratings.dat).
RawRatings ReadDoubleColonRatings(const std::string& path);

// Comma separated with a header naming the three columns.
RawRatings ReadCsvRatings(const std::string& path,
                          const std::string& user_column,
                          const std::string& item_column,
                          const std::string& rating_column);

// Raw ratings to dense edges; ids are numbered by first occurrence.
struct MappedRatings {
  split::RatingEdges edges;
  mapping::IdMap<int64_t> user_ids;
  mapping::IdMap<int64_t> item_ids;
};

MappedRatings MapRatings(const RawRatings& raw);

}  // namespace ratinggraph::dataloaders
