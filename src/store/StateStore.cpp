#include "store/StateStore.hpp"

#include "model/Json.hpp"

namespace skynode::store {

static constexpr std::string_view kSchema = R"sql(
CREATE TABLE IF NOT EXISTS alert_rules (
  id                TEXT PRIMARY KEY,
  name              TEXT NOT NULL,
  description       TEXT NOT NULL DEFAULT '',
  metric_name       TEXT NOT NULL,
  threshold         REAL NOT NULL,
  comparison        TEXT NOT NULL,
  severity          TEXT NOT NULL,
  cooldown_seconds  INTEGER NOT NULL,
  enabled           INTEGER NOT NULL,
  last_triggered_ms INTEGER,
  notify_nodes      TEXT NOT NULL DEFAULT '[]'
);
CREATE TABLE IF NOT EXISTS alert_records (
  seq              INTEGER PRIMARY KEY AUTOINCREMENT,
  id               TEXT NOT NULL UNIQUE,
  rule_id          TEXT NOT NULL,
  rule_name        TEXT NOT NULL,
  severity         TEXT NOT NULL,
  message          TEXT NOT NULL,
  source_node_id   TEXT NOT NULL,
  source_node_name TEXT NOT NULL,
  timestamp_ms     INTEGER NOT NULL,
  acknowledged     INTEGER NOT NULL DEFAULT 0
);
)sql";

util::Result<std::unique_ptr<StateStore>> StateStore::open(const std::filesystem::path& file) {
  std::error_code ec;
  if (file.has_parent_path()) std::filesystem::create_directories(file.parent_path(), ec);
  if (ec) return util::fail(util::Errc::StorageError, "cannot create " + file.parent_path().string() + ": " + ec.message());
  auto db = Database::open(file.string());
  if (!db) return std::unexpected(db.error());
  auto store = std::make_unique<StateStore>(Key{}, std::move(*db));
  if (auto r = store->migrate(); !r) return std::unexpected(r.error());
  return store;
}

util::Result<void> StateStore::migrate() {
  return db_->exec(kSchema);
}

util::Result<void> StateStore::save_rule(const model::AlertRule& rule) {
  std::scoped_lock lk(mu_);
  auto stmt = db_->prepare(
    "INSERT INTO alert_rules (id, name, description, metric_name, threshold, comparison, severity,"
    " cooldown_seconds, enabled, last_triggered_ms, notify_nodes)"
    " VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)"
    " ON CONFLICT(id) DO UPDATE SET name = excluded.name, description = excluded.description,"
    " metric_name = excluded.metric_name, threshold = excluded.threshold,"
    " comparison = excluded.comparison, severity = excluded.severity,"
    " cooldown_seconds = excluded.cooldown_seconds, enabled = excluded.enabled,"
    " last_triggered_ms = excluded.last_triggered_ms, notify_nodes = excluded.notify_nodes");
  if (!stmt) return std::unexpected(stmt.error());
  Json::Value targets(Json::arrayValue);
  for (const auto& id : rule.notify_nodes) targets.append(id);
  stmt->bind(1, std::string_view(rule.id))
       .bind(2, std::string_view(rule.name))
       .bind(3, std::string_view(rule.description))
       .bind(4, std::string_view(rule.metric_name))
       .bind(5, rule.threshold)
       .bind(6, std::string_view(model::to_symbol(rule.comparison)))
       .bind(7, std::string_view(model::to_string(rule.severity)))
       .bind(8, static_cast<int64_t>(rule.cooldown_seconds))
       .bind(9, static_cast<int64_t>(rule.enabled ? 1 : 0));
  if (rule.last_triggered) stmt->bind(10, util::to_epoch_ms(*rule.last_triggered));
  else stmt->bind_null(10);
  auto targets_text = model::write_compact(targets);
  stmt->bind(11, std::string_view(targets_text));
  auto r = stmt->step();
  if (!r) return std::unexpected(r.error());
  return {};
}

util::Result<void> StateStore::delete_rule(std::string_view id) {
  std::scoped_lock lk(mu_);
  auto stmt = db_->prepare("DELETE FROM alert_rules WHERE id = ?1");
  if (!stmt) return std::unexpected(stmt.error());
  stmt->bind(1, id);
  auto r = stmt->step();
  if (!r) return std::unexpected(r.error());
  return {};
}

util::Result<std::vector<model::AlertRule>> StateStore::load_rules() {
  std::scoped_lock lk(mu_);
  auto stmt = db_->prepare(
    "SELECT id, name, description, metric_name, threshold, comparison, severity,"
    " cooldown_seconds, enabled, last_triggered_ms, notify_nodes FROM alert_rules ORDER BY rowid");
  if (!stmt) return std::unexpected(stmt.error());
  std::vector<model::AlertRule> out;
  for (;;) {
    auto row = stmt->step();
    if (!row) return std::unexpected(row.error());
    if (!*row) break;
    model::AlertRule r;
    r.id = stmt->column_text(0);
    r.name = stmt->column_text(1);
    r.description = stmt->column_text(2);
    r.metric_name = stmt->column_text(3);
    r.threshold = stmt->column_double(4);
    r.comparison = model::parse_comparison(stmt->column_text(5)).value_or(model::Comparison::Greater);
    r.severity = model::parse_severity(stmt->column_text(6)).value_or(model::Severity::Warning);
    r.cooldown_seconds = static_cast<uint32_t>(stmt->column_int64(7));
    r.enabled = stmt->column_int64(8) != 0;
    if (!stmt->column_is_null(9)) r.last_triggered = util::from_epoch_ms(stmt->column_int64(9));
    if (auto targets = model::parse_json(stmt->column_text(10)); targets && targets->isArray()) {
      for (const auto& id : *targets)
        if (id.isString()) r.notify_nodes.push_back(id.asString());
    }
    out.push_back(std::move(r));
  }
  return out;
}

util::Result<void> StateStore::save_record(const model::AlertRecord& record) {
  std::scoped_lock lk(mu_);
  auto stmt = db_->prepare(
    "INSERT INTO alert_records (id, rule_id, rule_name, severity, message, source_node_id,"
    " source_node_name, timestamp_ms, acknowledged) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)"
    " ON CONFLICT(id) DO UPDATE SET acknowledged = excluded.acknowledged");
  if (!stmt) return std::unexpected(stmt.error());
  const auto& e = record.event;
  stmt->bind(1, std::string_view(record.id))
       .bind(2, std::string_view(e.rule_id))
       .bind(3, std::string_view(e.rule_name))
       .bind(4, std::string_view(model::to_string(e.severity)))
       .bind(5, std::string_view(e.message))
       .bind(6, std::string_view(e.source_node_id))
       .bind(7, std::string_view(e.source_node_name))
       .bind(8, util::to_epoch_ms(e.timestamp))
       .bind(9, static_cast<int64_t>(record.acknowledged ? 1 : 0));
  auto r = stmt->step();
  if (!r) return std::unexpected(r.error());
  return {};
}

util::Result<void> StateStore::delete_record(std::string_view id) {
  std::scoped_lock lk(mu_);
  auto stmt = db_->prepare("DELETE FROM alert_records WHERE id = ?1");
  if (!stmt) return std::unexpected(stmt.error());
  stmt->bind(1, id);
  auto r = stmt->step();
  if (!r) return std::unexpected(r.error());
  return {};
}

util::Result<void> StateStore::clear_records() {
  std::scoped_lock lk(mu_);
  return db_->exec("DELETE FROM alert_records");
}

util::Result<std::vector<model::AlertRecord>> StateStore::load_records() {
  std::scoped_lock lk(mu_);
  auto stmt = db_->prepare(
    "SELECT id, rule_id, rule_name, severity, message, source_node_id, source_node_name,"
    " timestamp_ms, acknowledged FROM alert_records ORDER BY seq");
  if (!stmt) return std::unexpected(stmt.error());
  std::vector<model::AlertRecord> out;
  for (;;) {
    auto row = stmt->step();
    if (!row) return std::unexpected(row.error());
    if (!*row) break;
    model::AlertRecord r;
    r.id = stmt->column_text(0);
    r.event.rule_id = stmt->column_text(1);
    r.event.rule_name = stmt->column_text(2);
    r.event.severity = model::parse_severity(stmt->column_text(3)).value_or(model::Severity::Info);
    r.event.message = stmt->column_text(4);
    r.event.source_node_id = stmt->column_text(5);
    r.event.source_node_name = stmt->column_text(6);
    r.event.timestamp = util::from_epoch_ms(stmt->column_int64(7));
    r.acknowledged = stmt->column_int64(8) != 0;
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace skynode::store
