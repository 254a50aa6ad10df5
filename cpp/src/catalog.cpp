#include "diagram_stream.hpp"

#include "text_util.hpp"

namespace diagram_stream {

using detail::to_lower;
using detail::trim_copy;

// ---------------- Diagram Type Registry ----------------

std::string normalize_type_id(const std::string& raw) { return to_lower(trim_copy(raw)); }

DiagramCatalog::DiagramCatalog(std::vector<DiagramTypeDefinition> definitions, std::string system_template,
                               std::string user_template)
    : definitions_(std::move(definitions)),
      system_template_(std::move(system_template)),
      user_template_(std::move(user_template)) {
  for (size_t i = 0; i < definitions_.size(); ++i) {
    auto& def = definitions_[i];
    def.id = normalize_type_id(def.id);
    if (def.id.empty()) throw DiagramStreamError("diagram type definition without id");
    if (def.declaration_keywords.empty()) {
      throw DiagramStreamError("diagram type '" + def.id + "' has no declaration keywords");
    }
    if (def.canonical_declaration.empty()) {
      def.canonical_declaration = def.declaration_keywords.front();
      if (!def.default_direction.empty()) def.canonical_declaration += " " + def.default_direction;
    }
    if (!index_.emplace(def.id, i).second) {
      throw DiagramStreamError("duplicate diagram type '" + def.id + "'");
    }
  }
  for (size_t i = 0; i < definitions_.size(); ++i) {
    for (const auto& alias : definitions_[i].aliases) {
      // Ids take precedence over aliases.
      index_.emplace(normalize_type_id(alias), i);
    }
  }
}

const DiagramTypeDefinition* DiagramCatalog::find(const std::string& type) const {
  auto it = index_.find(normalize_type_id(type));
  if (it == index_.end()) return nullptr;
  return &definitions_[it->second];
}

const DiagramTypeDefinition& DiagramCatalog::at(const std::string& type) const {
  const auto* def = find(type);
  if (!def) throw DiagramStreamError("Invalid diagram type: " + type, ErrorKind::Rejected);
  return *def;
}

namespace {

const char* kSystemTemplate =
    "You are a helpful assistant that creates a {diagram_type} diagram. Use the description below and the "
    "example provided to generate a professional diagram:\n"
    "{description}\n"
    "--\n"
    "Example:\n"
    "{example}\n"
    "--\n"
    "Context handling:\n"
    "1. This is a continuous conversation. Keep the context of earlier messages.\n"
    "2. When the user asks for changes, modify the existing diagram instead of starting a new one.\n"
    "3. Keep existing elements and structure unless told to remove or change them.\n"
    "4. Always return the complete diagram inside a single ```mermaid fenced block.";

const char* kUserTemplate =
    "Please create a {diagram_type} diagram based on the following prompt:\n"
    "{prompt}\n"
    "--\n"
    "Use the example as guidance:\n"
    "{example}";

const char* kFencedPromptTail =
    "\n\nImportant:\n"
    "- Start with ```mermaid\n"
    "- Output exactly one diagram\n"
    "- End with ```\n";

DiagramTypeDefinition make_def(std::string id, std::vector<std::string> keywords, std::string declaration,
                               std::string direction, std::string description, std::string example,
                               std::vector<std::string> aliases = {}) {
  DiagramTypeDefinition def;
  def.id = std::move(id);
  def.declaration_keywords = std::move(keywords);
  def.canonical_declaration = std::move(declaration);
  def.default_direction = std::move(direction);
  def.description = std::move(description);
  def.example = std::move(example);
  def.aliases = std::move(aliases);
  def.prompt_template =
      "As an expert Mermaid diagram author, create a professional " + def.id +
      " diagram.\n\nRequirements: {prompt}\n\nReference this example for structure and styling:\n{example}" +
      kFencedPromptTail;
  return def;
}

DiagramCatalog build_default_catalog() {
  std::vector<DiagramTypeDefinition> defs;

  defs.push_back(make_def("flowchart", {"flowchart", "graph"}, "flowchart TD", "TD",
                          "A flowchart using TD/BT/LR/RL direction, shaped nodes ([process], {decision}, "
                          "([start/end]), [(database)]), labelled links with |text|, subgraphs for grouping "
                          "and classDef styling.",
                          R"(flowchart LR
  Client((Client))
  subgraph gateway [API Gateway]
    LoadBalancer[/Load Balancer/]
    Auth[Authentication]
  end
  Client --> LoadBalancer
  LoadBalancer --> Auth
  Auth -->|token| Service[(Service)]
  classDef service fill:#f9f,stroke:#333
  class Service service)",
                          {"flow", "graph"}));

  defs.push_back(make_def("sequence", {"sequenceDiagram"}, "sequenceDiagram", "",
                          "A sequence diagram with participants and actors, synchronous (->>) and "
                          "asynchronous (-)) messages, activations, and alt/opt/loop blocks.",
                          R"(sequenceDiagram
  actor User
  participant API
  participant DB
  User->>API: POST /login
  activate API
  API->>DB: find user
  DB-->>API: user row
  alt valid password
    API-->>User: 200 token
  else invalid
    API-->>User: 401
  end
  deactivate API)",
                          {"sequencediagram"}));

  defs.push_back(make_def("class", {"classDiagram", "classDiagram-v2"}, "classDiagram", "",
                          "A class diagram with typed attributes, method signatures, access modifiers "
                          "(+ - # ~), <<interface>> stereotypes and relationship arrows (--|>, ..|>, *--, o--).",
                          R"(classDiagram
  class ITask {
    <<interface>>
    +getStatus() TaskStatus
  }
  class Task {
    -id: UUID
    -title: string
    +getStatus() TaskStatus
  }
  Task ..|> ITask
  User "1" o-- "many" Task)",
                          {"classdiagram"}));

  defs.push_back(make_def("state", {"stateDiagram-v2", "stateDiagram"}, "stateDiagram-v2", "",
                          "A state diagram with [*] start/end states, labelled transitions, composite "
                          "states and notes.",
                          R"(stateDiagram-v2
  [*] --> Idle
  Idle --> Running : start
  state Running {
    [*] --> Working
    Working --> Paused : pause
    Paused --> Working : resume
  }
  Running --> [*] : stop)",
                          {"statediagram"}));

  defs.push_back(make_def("erd", {"erDiagram"}, "erDiagram", "",
                          "An entity relationship diagram with typed attributes, PK/FK markers and "
                          "cardinality relationships (||--o{, }|--|{).",
                          R"(erDiagram
  USER ||--o{ ORDER : places
  ORDER ||--|{ LINE_ITEM : contains
  USER {
    uuid id PK
    string email
  }
  ORDER {
    uuid id PK
    uuid user_id FK
  })",
                          {"er", "entity", "entity-relationship"}));

  defs.push_back(make_def("gantt", {"gantt"}, "gantt", "",
                          "A gantt chart with title, dateFormat, sections and tasks using ids, "
                          "dependencies (after x) and durations.",
                          R"(gantt
  title Release plan
  dateFormat YYYY-MM-DD
  section Build
  Design      :a1, 2024-01-01, 5d
  Implement   :a2, after a1, 10d
  section Ship
  Release     :milestone, after a2, 0d)"));

  defs.push_back(make_def("pie", {"pie"}, "pie", "",
                          "A pie chart with an optional title and quoted labels with numeric values.",
                          R"(pie title Traffic sources
  "Search" : 55
  "Direct" : 30
  "Social" : 15)",
                          {"piechart"}));

  defs.push_back(make_def("mindmap", {"mindmap"}, "mindmap", "",
                          "A mindmap using indentation for hierarchy, a root node and shaped children.",
                          R"(mindmap
  root((Project Plan))
    Requirements
      Functional
      Non-Functional
    Resources
      Team
      Tools)"));

  defs.push_back(make_def("timeline", {"timeline"}, "timeline", "",
                          "A timeline with a title, time periods and one or more events per period.",
                          R"(timeline
  title History of the product
  2019 : Prototype
  2020 : Public beta : First customers
  2021 : General availability)"));

  defs.push_back(make_def("sankey", {"sankey-beta"}, "sankey-beta", "",
                          "A sankey diagram given as CSV rows source,target,value.",
                          R"(sankey-beta
Revenue,Salaries,60
Revenue,Infrastructure,25
Revenue,Profit,15)",
                          {"sankey-beta"}));

  defs.push_back(make_def("git", {"gitGraph"}, "gitGraph", "",
                          "A git graph with commits, branches, checkouts and merges.",
                          R"(gitGraph
  commit
  branch feature
  checkout feature
  commit
  checkout main
  merge feature
  commit)",
                          {"gitgraph"}));

  defs.push_back(make_def("architecture", {"architecture-beta"}, "architecture-beta", "",
                          "An architecture diagram with groups, services with icons (cloud, database, disk, "
                          "internet, server) and edges between ports L, R, T, B.",
                          R"(architecture-beta
  group api(cloud)[API]
  service db(database)[Database] in api
  service disk1(disk)[Storage] in api
  service server(server)[Server] in api
  db:L -- R:server
  disk1:T -- B:server)",
                          {"architecture-beta"}));

  return DiagramCatalog(std::move(defs), kSystemTemplate, kUserTemplate);
}

DiagramTypeDefinition definition_from_json(const std::string& id, const JsonObject& o) {
  DiagramTypeDefinition def;
  def.id = id;
  def.declaration_keywords = json_string_list(o, "keywords");
  if (def.declaration_keywords.empty()) def.declaration_keywords.push_back(id);
  def.canonical_declaration = json_string_or(o, "declaration");
  def.default_direction = json_string_or(o, "direction");
  def.description = json_string_or(o, "description");
  def.prompt_template = json_string_or(o, "prompt_template");
  def.system_template = json_string_or(o, "system_template");
  def.example = json_string_or(o, "example");
  def.aliases = json_string_list(o, "aliases");
  return def;
}

}  // namespace

const DiagramCatalog& default_catalog() {
  static const DiagramCatalog catalog = build_default_catalog();
  return catalog;
}

DiagramCatalog load_catalog(const std::string& json_text) {
  Json doc;
  try {
    doc = loads_json(json_text);
  } catch (const std::runtime_error& e) {
    throw DiagramStreamError(std::string("invalid catalog: ") + e.what(), ErrorKind::Rejected);
  }
  if (!doc.is_object()) throw DiagramStreamError("invalid catalog: root must be an object");
  const auto& root = doc.as_object();

  std::string system_template = kSystemTemplate;
  std::string user_template = kUserTemplate;
  auto it_prompts = root.find("prompts");
  if (it_prompts != root.end() && it_prompts->second.is_object()) {
    const auto& prompts = it_prompts->second.as_object();
    system_template = json_string_or(prompts, "system_template", system_template);
    user_template = json_string_or(prompts, "user_template", user_template);
  }

  auto it_defs = root.find("definitions");
  if (it_defs == root.end() || !it_defs->second.is_object()) {
    throw DiagramStreamError("invalid catalog: missing 'definitions' object");
  }
  std::vector<DiagramTypeDefinition> defs;
  for (const auto& kv : it_defs->second.as_object()) {
    if (!kv.second.is_object()) {
      throw DiagramStreamError("invalid catalog: definition '" + kv.first + "' must be an object");
    }
    defs.push_back(definition_from_json(kv.first, kv.second.as_object()));
  }
  if (defs.empty()) throw DiagramStreamError("invalid catalog: no definitions");
  return DiagramCatalog(std::move(defs), std::move(system_template), std::move(user_template));
}

DiagramCatalog load_catalog_file(const std::string& path) {
  DiagramCatalog catalog = load_catalog(read_text_file(path));
  logger()->info("catalog: loaded {} diagram types from {}", catalog.definitions().size(), path);
  return catalog;
}

}  // namespace diagram_stream
