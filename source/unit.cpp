#include <svcman/errors.hpp>
#include <svcman/unit.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace svcman {

static std::string trim(std::string s){
  while(!s.empty() && (s.back()==' '||s.back()=='\t'||s.back()=='\r'||s.back()=='\n')) s.pop_back();
  size_t i=0; while(i<s.size() && (s[i]==' '||s[i]=='\t')) ++i; return s.substr(i);
}

std::vector<std::string> split_cmd(const std::string& s){
  std::vector<std::string> out;
  std::string cur; bool in_single=false, in_double=false, esc=false, quoted=false;
  for(char c: s){
    if (esc){ cur.push_back(c); esc=false; continue; }
    if (c=='\\' && !in_single){ esc=true; continue; }
    if (c=='\'' && !in_double){ in_single=!in_single; quoted=true; continue; }
    if (c=='"'  && !in_single){ in_double=!in_double; quoted=true; continue; }
    if (!in_single && !in_double && (c==' '||c=='\t')){
      if (!cur.empty() || quoted){ out.push_back(cur); cur.clear(); quoted=false; }
      continue;
    }
    cur.push_back(c);
  }
  if (!cur.empty() || quoted) out.push_back(cur);
  return out;
}

static int parse_int(const fs::path& unit, const std::string& key, const std::string& val){
  size_t used = 0;
  int v = 0;
  try { v = std::stoi(val, &used); } catch (const std::exception&) { used = 0; }
  if (used == 0 || used != val.size() || v < 0)
    throw ConfigError(fmt::format("{}: {}: invalid value '{}'", unit.string(), key, val));
  return v;
}

static void add_env_list(std::vector<std::string>& env, const std::string& val){
  std::stringstream ss(val); std::string kv;
  while (std::getline(ss, kv, ';')) {
    auto pos = kv.find('=');
    if (pos==std::string::npos) continue;
    auto k = trim(kv.substr(0,pos));
    auto v = trim(kv.substr(pos+1));
    if (!k.empty()) env.push_back(k + "=" + v);
  }
}

static void load_env_file(const std::string& name, std::vector<std::string>& env, const fs::path& file){
  std::ifstream in(file);
  if (!in) { spdlog::warn("[svc={}] EnvironmentFile not found: {}", name, file.string()); return; }
  std::string line;
  while (std::getline(in, line)) {
    auto s = trim(line);
    if (s.empty() || s[0]=='#' || s[0]==';') continue;
    auto pos = s.find('=');
    if (pos==std::string::npos) continue;
    auto k = trim(s.substr(0,pos));
    auto v = trim(s.substr(pos+1));
    if (!k.empty()) env.push_back(k + "=" + v);
  }
}

namespace {
// collected first: the pid file default and relative paths depend on the whole section
struct UnitFields {
  std::string name;
  std::vector<std::string> exec;
  fs::path working_dir;
  std::vector<std::string> env;
  std::vector<fs::path> env_files;
  fs::path pid_file;
  std::vector<Probe> probes; // in file order
  int ready_timeout_sec = 30;
  int poll_interval_ms = 100;
  int timeout_stop_sec = 5;
};
} // namespace

ServiceConfig load_unit(const fs::path& p) {
  const fs::path path = fs::absolute(p);
  const fs::path base = path.parent_path();
  std::ifstream in(path);
  if (!in) throw ConfigError("Unit file not found: " + p.string());

  UnitFields u;
  u.name = path.stem().string();

  bool in_service=false;
  std::string line;
  int lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    line = trim(line);
    if (line.empty() || line[0]=='#' || line[0]==';') continue;
    if (line.front()=='[' && line.back()==']') {
      in_service = (line == "[Service]");
      continue;
    }
    if (!in_service) continue;

    auto eq = line.find('=');
    if (eq==std::string::npos) {
      spdlog::warn("{}:{}: ignoring line without '='", path.string(), lineno);
      continue;
    }
    auto key = trim(line.substr(0,eq));
    auto val = trim(line.substr(eq+1));

    if (key=="Name") {
      if (!val.empty()) u.name = val;

    } else if (key=="ExecStart") {
      u.exec = split_cmd(val);

    } else if (key=="WorkingDirectory") {
      if (!val.empty()) u.working_dir = fs::path(val);

    } else if (key=="Environment") {
      add_env_list(u.env, val);

    } else if (key=="EnvironmentFile") {
      std::stringstream ss(val); std::string one;
      while (std::getline(ss, one, ';')) {
        one = trim(one);
        if (!one.empty()) u.env_files.push_back(one);
      }

    } else if (key=="PIDFile") {
      if (!val.empty()) u.pid_file = fs::path(val);

    } else if (key=="ReadyDial") {
      auto parts = split_cmd(val);
      if (parts.size() != 2)
        throw ConfigError(fmt::format("{}:{}: ReadyDial expects '<network> <address>'", path.string(), lineno));
      u.probes.push_back(dial_probe(parts[0], parts[1]));

    } else if (key=="ReadyHttp") {
      auto parts = split_cmd(val);
      if (parts.empty() || parts.size() > 2)
        throw ConfigError(fmt::format("{}:{}: ReadyHttp expects '<url> [status]'", path.string(), lineno));
      int status = parts.size() == 2 ? parse_int(path, key, parts[1]) : 200;
      u.probes.push_back(http_probe(parts[0], status));

    } else if (key=="ReadyExec") {
      auto argv = split_cmd(val);
      if (argv.empty())
        throw ConfigError(fmt::format("{}:{}: ReadyExec is empty", path.string(), lineno));
      u.probes.push_back(exec_probe(std::move(argv)));

    } else if (key=="ReadyTimeoutSec") {
      u.ready_timeout_sec = parse_int(path, key, val);

    } else if (key=="PollIntervalMs") {
      u.poll_interval_ms = parse_int(path, key, val);
      if (u.poll_interval_ms == 0)
        throw ConfigError(fmt::format("{}: PollIntervalMs must be positive", path.string()));

    } else if (key=="TimeoutStopSec") {
      u.timeout_stop_sec = parse_int(path, key, val);

    } else {
      spdlog::warn("{}:{}: unknown key {}", path.string(), lineno, key);
    }
  }

  if (u.exec.empty()) throw ConfigError(path.string() + ": ExecStart is required");

  if (!u.working_dir.empty() && u.working_dir.is_relative()) u.working_dir = base / u.working_dir;
  for (auto& ef : u.env_files) {
    if (ef.is_relative()) ef = base / ef;
    load_env_file(u.name, u.env, ef);
  }

  ServiceConfig cfg(u.name);
  cfg.run(u.exec.front(), std::vector<std::string>(u.exec.begin() + 1, u.exec.end()));
  if (!u.working_dir.empty()) cfg.dir(u.working_dir);
  cfg.env(u.env);
  if (!u.pid_file.empty()) {
    fs::path pf = u.pid_file;
    if (pf.is_relative()) pf = (u.working_dir.empty() ? base : u.working_dir) / pf;
    cfg.pid_file(pf);
  }
  for (auto& probe : u.probes) cfg.check(std::move(probe));
  cfg.ready_timeout(std::chrono::seconds(u.ready_timeout_sec))
     .poll_interval(std::chrono::milliseconds(u.poll_interval_ms))
     .stop_timeout(std::chrono::seconds(u.timeout_stop_sec));
  return cfg;
}

} // namespace svcman
