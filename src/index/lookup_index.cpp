/**
 * @file lookup_index.cpp
 * @brief Lookup index implementation
 */

#include "index/lookup_index.h"

#include <algorithm>
#include <iterator>
#include <unordered_set>

#include "utils/constants.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace phonegen::index {

using utils::ErrorCode;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

std::string DescribeRecord(const GeoOperatorRecord& record) {
  return record.prefix + "/" + record.middle_segment + " (" + record.province + " " + record.city +
         ", operator " + std::to_string(record.operator_code) + ")";
}

bool IsWellFormed(const GeoOperatorRecord& record) {
  return utils::IsDigits(record.prefix, constants::kPrefixDigits) &&
         utils::IsDigits(record.middle_segment, constants::kMiddleSegmentDigits) && !record.province.empty() &&
         !record.city.empty() && record.operator_code >= constants::kMinOperatorCode &&
         record.operator_code <= constants::kMaxOperatorCode;
}

}  // namespace

utils::Expected<std::unique_ptr<LookupIndex>, utils::Error> LookupIndex::Build(
    std::vector<GeoOperatorRecord> records) {
  std::unordered_set<std::string> seen_keys;
  seen_keys.reserve(records.size());

  auto index = std::unique_ptr<LookupIndex>(new LookupIndex());

  for (auto& record : records) {
    if (!IsWellFormed(record)) {
      return MakeUnexpected(
          MakeError(ErrorCode::kLookupInvalidRecord, "Malformed attribution record: " + DescribeRecord(record)));
    }

    // prefix and middle segment have fixed widths, so concatenation is unambiguous
    if (!seen_keys.insert(record.prefix + record.middle_segment).second) {
      utils::StructuredLog()
          .Event("lookup_build_failed")
          .Field("type", "duplicate_key")
          .Field("prefix", record.prefix)
          .Field("middle_segment", record.middle_segment)
          .Error();
      return MakeUnexpected(MakeError(ErrorCode::kLookupDuplicateKey,
                                      "Duplicate (prefix, middle_segment) key: " + DescribeRecord(record)));
    }

    RegionGroup& group = index->regions_[RegionKey(record.province, record.city)];
    group.by_operator[record.operator_code].push_back(record);
    group.all.push_back(std::move(record));
    ++index->record_count_;
  }

  for (auto& [key, group] : index->regions_) {
    std::sort(group.all.begin(), group.all.end(), CandidateLess);
    for (auto& [code, bucket] : group.by_operator) {
      std::sort(bucket.begin(), bucket.end(), CandidateLess);
    }
  }

  utils::StructuredLog()
      .Event("lookup_index_built")
      .Field("records", static_cast<uint64_t>(index->record_count_))
      .Field("regions", static_cast<uint64_t>(index->regions_.size()))
      .Info();

  return index;
}

std::vector<GeoOperatorRecord> LookupIndex::Lookup(const std::string& province, const std::string& city,
                                                   const std::set<int>& operator_codes) const {
  auto iter = regions_.find(RegionKey(province, city));
  if (iter == regions_.end()) {
    return {};
  }
  const RegionGroup& group = iter->second;

  if (operator_codes.empty()) {
    return group.all;
  }

  std::vector<GeoOperatorRecord> result;
  for (int code : operator_codes) {
    auto bucket = group.by_operator.find(code);
    if (bucket == group.by_operator.end()) {
      continue;
    }
    std::vector<GeoOperatorRecord> merged;
    merged.reserve(result.size() + bucket->second.size());
    std::merge(result.begin(), result.end(), bucket->second.begin(), bucket->second.end(),
               std::back_inserter(merged), CandidateLess);
    result = std::move(merged);
  }
  return result;
}

std::vector<GeoOperatorRecord> LookupIndex::Lookup(const std::string& prefix, const std::string& province,
                                                   const std::string& city,
                                                   const std::set<int>& operator_codes) const {
  std::vector<GeoOperatorRecord> records = Lookup(province, city, operator_codes);
  records.erase(std::remove_if(records.begin(), records.end(),
                               [&prefix](const GeoOperatorRecord& record) { return record.prefix != prefix; }),
                records.end());
  return records;
}

std::vector<std::string> LookupIndex::Provinces() const {
  std::vector<std::string> provinces;
  for (const auto& [key, group] : regions_) {
    // regions_ is ordered by (province, city), so equal provinces are adjacent
    if (provinces.empty() || provinces.back() != key.first) {
      provinces.push_back(key.first);
    }
  }
  return provinces;
}

std::vector<std::string> LookupIndex::Cities(const std::string& province) const {
  std::vector<std::string> cities;
  for (auto iter = regions_.lower_bound(RegionKey(province, std::string()));
       iter != regions_.end() && iter->first.first == province; ++iter) {
    cities.push_back(iter->first.second);
  }
  return cities;
}

}  // namespace phonegen::index
