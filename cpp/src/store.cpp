#include "diagram_stream.hpp"

#include <filesystem>
#include <fstream>

namespace diagram_stream {

// ---------------- History ----------------

void push_history(std::vector<HistoryEntry>& history, HistoryEntry entry, size_t cap) {
  history.insert(history.begin(), std::move(entry));
  if (history.size() > cap) history.resize(cap);
}

int64_t unix_millis_now() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

static HistoryEntry history_entry_for(const CommitRequest& req, const std::string& artifact_id) {
  HistoryEntry e;
  e.artifact_id = artifact_id;
  e.request_id = req.request_id;
  e.prompt = req.prompt;
  e.diagram_text = req.diagram_text;
  e.kind = "chat";
  e.timestamp = req.timestamp ? req.timestamp : unix_millis_now();
  return e;
}

static const HistoryEntry* find_committed(const std::vector<HistoryEntry>& history, const std::string& request_id) {
  if (request_id.empty()) return nullptr;
  for (const auto& e : history) {
    if (e.request_id == request_id) return &e;
  }
  return nullptr;
}

// ---------------- MemoryArtifactStore ----------------

void MemoryArtifactStore::set_balance(const std::string& user_id, int64_t balance) {
  std::lock_guard<std::mutex> lock(mu_);
  balances_[user_id] = balance;
}

std::string MemoryArtifactStore::current_diagram(const std::string& project_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = projects_.find(project_id);
  return it == projects_.end() ? std::string() : it->second.current_diagram;
}

std::string MemoryArtifactStore::preview(const std::string& project_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = projects_.find(project_id);
  return it == projects_.end() ? std::string() : it->second.preview;
}

size_t MemoryArtifactStore::commit_count() {
  std::lock_guard<std::mutex> lock(mu_);
  return commit_count_;
}

void MemoryArtifactStore::seed_history(const std::string& project_id, std::vector<HistoryEntry> entries) {
  std::lock_guard<std::mutex> lock(mu_);
  projects_[project_id].history = std::move(entries);
}

int64_t MemoryArtifactStore::quota_balance(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = balances_.find(user_id);
  return it == balances_.end() ? default_balance_ : it->second;
}

CommitReceipt MemoryArtifactStore::commit(const CommitRequest& request) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it_bal = balances_.find(request.user_id);
  int64_t balance = it_bal == balances_.end() ? default_balance_ : it_bal->second;

  auto& project = projects_[request.project_id];
  if (const auto* prior = find_committed(project.history, request.request_id)) {
    return CommitReceipt{prior->artifact_id, true, balance};
  }
  if (balance < request.cost) throw DiagramStreamError("Insufficient token balance", ErrorKind::Rejected);

  std::string artifact_id = "art-" + std::to_string(next_id_++);
  balances_[request.user_id] = balance - request.cost;
  push_history(project.history, history_entry_for(request, artifact_id));
  project.current_diagram = request.diagram_text;
  commit_count_++;
  return CommitReceipt{artifact_id, false, balance - request.cost};
}

void MemoryArtifactStore::store_preview(const std::string& project_id, const std::string& artifact_id,
                                        const std::string& image) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& project = projects_[project_id];
  project.preview = image;
  for (auto& e : project.history) {
    if (e.artifact_id == artifact_id) e.rendered_image = image;
  }
}

std::vector<HistoryEntry> MemoryArtifactStore::history(const std::string& project_id) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = projects_.find(project_id);
  return it == projects_.end() ? std::vector<HistoryEntry>{} : it->second.history;
}

// ---------------- FileArtifactStore ----------------

static Json history_to_json(const HistoryEntry& e) {
  return Json(JsonObject{{"artifactId", Json(e.artifact_id)},
                         {"requestId", Json(e.request_id)},
                         {"prompt", Json(e.prompt)},
                         {"diagram", Json(e.diagram_text)},
                         {"diagramImage", Json(e.rendered_image)},
                         {"type", Json(e.kind)},
                         {"timestamp", Json(static_cast<double>(e.timestamp))}});
}

static HistoryEntry history_from_json(const Json& v) {
  HistoryEntry e;
  if (!v.is_object()) return e;
  const auto& o = v.as_object();
  e.artifact_id = json_string_or(o, "artifactId");
  e.request_id = json_string_or(o, "requestId");
  e.prompt = json_string_or(o, "prompt");
  e.diagram_text = json_string_or(o, "diagram");
  e.rendered_image = json_string_or(o, "diagramImage");
  e.kind = json_string_or(o, "type", "chat");
  e.timestamp = static_cast<int64_t>(json_number_opt(o, "timestamp").value_or(0.0));
  return e;
}

static JsonObject& child_object(JsonObject& parent, const std::string& key) {
  auto& slot = parent[key];
  if (!slot.is_object()) slot = Json(JsonObject{});
  return slot.as_object();
}

FileArtifactStore::FileArtifactStore(std::string directory, int64_t default_balance)
    : directory_(std::move(directory)), default_balance_(default_balance) {
  std::error_code ec;
  std::filesystem::create_directories(directory_, ec);
  if (ec) throw DiagramStreamError("cannot create store directory " + directory_ + ": " + ec.message(),
                                   ErrorKind::Persistence);
}

Json FileArtifactStore::load_locked() {
  const std::string path = directory_ + "/store.json";
  std::ifstream in(path, std::ios::binary);
  if (!in) return Json(JsonObject{});
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  try {
    Json doc = loads_json(text);
    if (!doc.is_object()) throw DiagramStreamError("store file " + path + " is not an object", ErrorKind::Persistence);
    return doc;
  } catch (const DiagramStreamError&) {
    throw;
  } catch (const std::runtime_error& e) {
    throw DiagramStreamError("corrupt store file " + path + ": " + e.what(), ErrorKind::Persistence);
  }
}

void FileArtifactStore::save_locked(const Json& doc) {
  const std::string path = directory_ + "/store.json";
  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) throw DiagramStreamError("cannot write " + tmp, ErrorKind::Persistence);
    out << dumps_json(doc);
    out.flush();
    if (!out) throw DiagramStreamError("short write to " + tmp, ErrorKind::Persistence);
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) throw DiagramStreamError("cannot replace " + path + ": " + ec.message(), ErrorKind::Persistence);
}

int64_t FileArtifactStore::quota_balance(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mu_);
  Json doc = load_locked();
  auto& users = child_object(doc.as_object(), "users");
  return static_cast<int64_t>(json_number_opt(users, user_id).value_or(static_cast<double>(default_balance_)));
}

CommitReceipt FileArtifactStore::commit(const CommitRequest& request) {
  std::lock_guard<std::mutex> lock(mu_);
  Json doc = load_locked();
  auto& root = doc.as_object();
  auto& users = child_object(root, "users");
  int64_t balance =
      static_cast<int64_t>(json_number_opt(users, request.user_id).value_or(static_cast<double>(default_balance_)));

  auto& project = child_object(child_object(root, "projects"), request.project_id);
  std::vector<HistoryEntry> history;
  auto it_hist = project.find("history");
  if (it_hist != project.end() && it_hist->second.is_array()) {
    for (const auto& v : it_hist->second.as_array()) history.push_back(history_from_json(v));
  }
  if (const auto* prior = find_committed(history, request.request_id)) {
    return CommitReceipt{prior->artifact_id, true, balance};
  }
  if (balance < request.cost) throw DiagramStreamError("Insufficient token balance", ErrorKind::Rejected);

  int64_t next = static_cast<int64_t>(json_number_opt(root, "nextArtifact").value_or(1.0));
  std::string artifact_id = "art-" + std::to_string(next);
  root["nextArtifact"] = Json(static_cast<double>(next + 1));
  users[request.user_id] = Json(static_cast<double>(balance - request.cost));

  push_history(history, history_entry_for(request, artifact_id));
  JsonArray hist_json;
  for (const auto& e : history) hist_json.push_back(history_to_json(e));
  project["history"] = Json(std::move(hist_json));
  project["currentDiagram"] = Json(request.diagram_text);
  project["diagramType"] = Json(request.diagram_type);

  save_locked(doc);
  return CommitReceipt{artifact_id, false, balance - request.cost};
}

void FileArtifactStore::store_preview(const std::string& project_id, const std::string& artifact_id,
                                      const std::string& image) {
  std::lock_guard<std::mutex> lock(mu_);
  Json doc = load_locked();
  auto& project = child_object(child_object(doc.as_object(), "projects"), project_id);
  project["diagramImage"] = Json(image);
  auto it_hist = project.find("history");
  if (it_hist != project.end() && it_hist->second.is_array()) {
    for (auto& v : it_hist->second.as_array()) {
      if (v.is_object() && json_string_or(v.as_object(), "artifactId") == artifact_id) {
        v.as_object()["diagramImage"] = Json(image);
      }
    }
  }
  save_locked(doc);
}

std::vector<HistoryEntry> FileArtifactStore::history(const std::string& project_id) {
  std::lock_guard<std::mutex> lock(mu_);
  Json doc = load_locked();
  std::vector<HistoryEntry> out;
  const auto& projects = child_object(doc.as_object(), "projects");
  auto it = projects.find(project_id);
  if (it == projects.end() || !it->second.is_object()) return out;
  auto it_hist = it->second.as_object().find("history");
  if (it_hist == it->second.as_object().end() || !it_hist->second.is_array()) return out;
  for (const auto& v : it_hist->second.as_array()) out.push_back(history_from_json(v));
  return out;
}

}  // namespace diagram_stream
