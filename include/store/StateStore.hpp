#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include "model/Alert.hpp"
#include "store/Database.hpp"
#include "util/Error.hpp"

namespace skynode::store {

// Durable home of alert rules and alert records. Every mutation is written
// through; the in-memory owners (RuleEngine, AlertHistory) stay authoritative.
class StateStore {
  struct Key { explicit Key() = default; };

public:
  StateStore(Key, std::unique_ptr<Database> db) : db_(std::move(db)) {}

  [[nodiscard]] static util::Result<std::unique_ptr<StateStore>> open(const std::filesystem::path& file);

  // Insert or update by id; a rule keeps its original position.
  [[nodiscard]] util::Result<void> save_rule(const model::AlertRule& rule);
  [[nodiscard]] util::Result<void> delete_rule(std::string_view id);
  [[nodiscard]] util::Result<std::vector<model::AlertRule>> load_rules();

  [[nodiscard]] util::Result<void> save_record(const model::AlertRecord& record);
  [[nodiscard]] util::Result<void> delete_record(std::string_view id);
  [[nodiscard]] util::Result<void> clear_records();
  // Oldest first.
  [[nodiscard]] util::Result<std::vector<model::AlertRecord>> load_records();

private:
  [[nodiscard]] util::Result<void> migrate();

  std::mutex mu_;
  std::unique_ptr<Database> db_;
};

} // namespace skynode::store
