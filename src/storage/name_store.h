#pragma once

#include <optional>
#include <string>

namespace trackcast {

struct NameRecord {
  std::optional<std::string> factory_name;
  std::optional<std::string> user_name;
};

// Durable udid -> names mapping. One record per udid, never deleted.
class NameStore {
public:
  virtual ~NameStore() = default;

  // absent when the udid was never stored or the lookup failed
  virtual std::optional<NameRecord> get(const std::string &udid) = 0;

  // only the provided names are written; throws Error on failure
  virtual void upsert(const std::string &udid,
                      const std::optional<std::string> &factory_name,
                      const std::optional<std::string> &user_name) = 0;
};

} // namespace trackcast
