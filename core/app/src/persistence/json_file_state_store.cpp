#include "gridcore/persistence/json_file_state_store.hpp"
#include "gridcore/errors/errors.hpp"
#include "gridcore/persistence/snapshot_json.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <deque>
#include <fstream>
#include <utility>

namespace gridcore {

namespace {

void appendLine(const std::string& path, const nlohmann::json& record) {
  std::ofstream out(path, std::ios::app);
  if (!out) {
    throw StateStoreError("cannot open " + path + " for appending");
  }
  out << record.dump() << "\n";
  out.flush();
  if (!out) {
    throw StateStoreError("failed appending to " + path);
  }
}

// Last `limit` records of a JSON Lines file, oldest first. A missing file
// is an empty journal.
template <typename Record>
std::vector<Record> readTail(const std::string& path, std::size_t limit) {
  std::ifstream in(path);
  if (!in || limit == 0) {
    return {};
  }

  std::deque<std::string> lines;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    lines.push_back(std::move(line));
    if (lines.size() > limit) {
      lines.pop_front();
    }
  }

  std::vector<Record> records;
  records.reserve(lines.size());
  try {
    for (const auto& text : lines) {
      records.push_back(nlohmann::json::parse(text).get<Record>());
    }
  } catch (const nlohmann::json::exception& e) {
    throw StateStoreError("corrupt journal " + path + ": " + e.what());
  }
  return records;
}

}  // namespace

JsonFileStateStore::JsonFileStateStore(std::string path)
    : path_(std::move(path)) {}

void JsonFileStateStore::saveState(const SessionSnapshot& snapshot) {
  const std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      throw StateStoreError("cannot open " + tmp_path + " for writing");
    }
    out << nlohmann::json(snapshot).dump(2) << "\n";
    out.flush();
    if (!out) {
      throw StateStoreError("failed writing " + tmp_path);
    }
  }

  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    throw StateStoreError("cannot replace " + path_ + ": " +
                          std::strerror(errno));
  }
}

std::optional<SessionSnapshot> JsonFileStateStore::loadState() {
  std::ifstream in(path_);
  if (!in) {
    return std::nullopt;
  }

  try {
    nlohmann::json doc = nlohmann::json::parse(in);
    return doc.get<SessionSnapshot>();
  } catch (const nlohmann::json::exception& e) {
    throw StateStoreError("corrupt state file " + path_ + ": " + e.what());
  }
}

void JsonFileStateStore::appendTrade(const TradeRecord& record) {
  std::lock_guard lock(journal_mutex_);
  appendLine(tradesPath(), nlohmann::json(record));
}

void JsonFileStateStore::appendEquity(const EquityRecord& record) {
  std::lock_guard lock(journal_mutex_);
  appendLine(equityPath(), nlohmann::json(record));
}

std::vector<TradeRecord> JsonFileStateStore::recentTrades(std::size_t limit) {
  std::lock_guard lock(journal_mutex_);
  return readTail<TradeRecord>(tradesPath(), limit);
}

std::vector<EquityRecord> JsonFileStateStore::recentEquity(std::size_t limit) {
  std::lock_guard lock(journal_mutex_);
  return readTail<EquityRecord>(equityPath(), limit);
}

}  // namespace gridcore
