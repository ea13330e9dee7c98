#include "memory_repository.hpp"

#include <set>

#include "memory_tx.hpp"

namespace aff4::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

static model::AttributeRecord MakeRecord(const std::string& urn, const std::string& attribute, uint64_t ts, const std::string& value) {
  return model::AttributeRecord{.urn = urn, .attribute = attribute, .timestamp_us = ts, .value = value};
}

Result MemoryRepository::AppendRecords(Transaction& t, const std::vector<model::AttributeRecord>& records) {
  auto& s = TX(t).Mutable();

  // validate first so a rejected batch leaves the working set untouched
  for (const auto& r : records) {
    auto obj = s.objects.find(r.urn);
    if (obj == s.objects.end()) continue;
    auto attr = obj->second.find(r.attribute);
    if (attr != obj->second.end() && attr->second.contains(r.timestamp_us)) {
      return Result::Err(ErrorCode::AlreadyExists, "record exists: " + r.urn + " " + r.attribute + "@" + std::to_string(r.timestamp_us));
    }
  }

  for (const auto& r : records) {
    auto& versions = s.objects[r.urn][r.attribute];
    if (!versions.emplace(r.timestamp_us, r.value).second) {
      return Result::Err(ErrorCode::AlreadyExists, "duplicate record in batch: " + r.urn + " " + r.attribute);
    }
  }
  return Result::Ok();
}

std::optional<model::AttributeRecord> MemoryRepository::GetLatest(Transaction& t, const std::string& urn, const std::string& attribute,
                                                                  uint64_t as_of_us) {
  const auto& s   = TX(t).View();
  auto        obj = s.objects.find(urn);
  if (obj == s.objects.end()) return std::nullopt;

  auto attr = obj->second.find(attribute);
  if (attr == obj->second.end()) return std::nullopt;

  // first version strictly newer than as_of, then step back
  auto it = attr->second.upper_bound(as_of_us);
  if (it == attr->second.begin()) return std::nullopt;
  --it;
  return MakeRecord(urn, attribute, it->first, it->second);
}

std::vector<model::AttributeRecord> MemoryRepository::GetHistory(Transaction& t, const std::string& urn, const std::string& attribute) {
  std::vector<model::AttributeRecord> out;

  const auto& s   = TX(t).View();
  auto        obj = s.objects.find(urn);
  if (obj == s.objects.end()) return out;

  auto attr = obj->second.find(attribute);
  if (attr == obj->second.end()) return out;

  out.reserve(attr->second.size());
  for (const auto& [ts, value] : attr->second) {
    out.push_back(MakeRecord(urn, attribute, ts, value));
  }
  return out;
}

std::vector<model::AttributeRecord> MemoryRepository::GetSnapshot(Transaction& t, const std::string& urn, uint64_t as_of_us) {
  std::vector<model::AttributeRecord> out;

  const auto& s   = TX(t).View();
  auto        obj = s.objects.find(urn);
  if (obj == s.objects.end()) return out;

  for (const auto& [attribute, versions] : obj->second) {
    auto it = versions.upper_bound(as_of_us);
    if (it == versions.begin()) continue;
    --it;
    out.push_back(MakeRecord(urn, attribute, it->first, it->second));
  }
  return out;
}

bool MemoryRepository::Exists(Transaction& t, const std::string& urn) {
  const auto& s = TX(t).View();
  return s.objects.contains(urn);
}

std::vector<std::string> MemoryRepository::ListChildren(Transaction& t, const std::string& urn) {
  std::set<std::string> children;

  const auto& s      = TX(t).View();
  const auto  prefix = urn.back() == '/' ? urn : urn + "/";

  for (auto it = s.objects.lower_bound(prefix); it != s.objects.end(); ++it) {
    const auto& key = it->first;
    if (key.compare(0, prefix.size(), prefix) != 0) break;

    const auto end   = key.find('/', prefix.size());
    auto       child = key.substr(0, end);
    if (child.size() == prefix.size()) continue;
    children.insert(std::move(child));
  }
  return {children.begin(), children.end()};
}

} // namespace aff4::db::memory
