#include "substrate/state_store.hpp"
#include "common/logger.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

static constexpr int kStateVersion = 1;

StateStore::StateStore(std::string path) : path_(std::move(path)) {}

void StateStore::Save(const PersistedState& state) const {
  nlohmann::json doc = {
    {"version", kStateVersion},
    {"saved_at", state.saved_at},
    {"position", state.position.ToJson()},
    {"observations", state.observations},
    {"pools", state.pools},
    {"unit_index", state.unit_index}
  };
  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::out | std::ios::trunc);
    if (!out.is_open()) throw std::runtime_error("cannot write state file " + tmp);
    out << doc.dump(2) << '\n';
    if (!out.good()) throw std::runtime_error("short write to state file " + tmp);
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec) throw std::runtime_error("cannot replace state file " + path_ + ": " + ec.message());
  BITRES_LOG_DEBUG("state saved to " + path_);
}

std::optional<PersistedState> StateStore::Load() const {
  std::ifstream in(path_);
  if (!in.is_open()) return std::nullopt;
  nlohmann::json doc;
  try {
    in >> doc;
    if (doc.at("version").get<int>() != kStateVersion) {
      throw std::runtime_error("unsupported state version " + doc.at("version").dump());
    }
    PersistedState state;
    state.saved_at = doc.at("saved_at").get<uint64_t>();
    state.position = CollateralPosition::FromJson(doc.at("position"));
    state.observations = doc.at("observations");
    state.pools = doc.value("pools", nlohmann::json::object());
    state.unit_index = doc.value("unit_index", nlohmann::json::object());
    return state;
  } catch (const nlohmann::json::exception& e) {
    throw std::runtime_error("corrupt state file " + path_ + ": " + e.what());
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("corrupt state file " + path_ + ": " + e.what());
  }
}
