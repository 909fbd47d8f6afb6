#include "mcpgate/container/create_options.hpp"

#include "mcpgate/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <openssl/evp.h>
#include <regex>
#include <set>
#include <sstream>

namespace mcpgate::container
{

namespace
{
std::string trim(const std::string& s)
{
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

bool all_digits(const std::string& s)
{
    return !s.empty() &&
           std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

std::vector<std::string> split(const std::string& s, char sep)
{
    std::vector<std::string> out;
    std::string cur;
    std::istringstream in(s);
    while (std::getline(in, cur, sep))
        out.push_back(cur);
    return out;
}

void append(Json& obj, const char* key, Json value)
{
    if (!obj.contains(key) || !obj[key].is_array())
        obj[key] = Json::array();
    obj[key].push_back(std::move(value));
}

// key=value with a non-empty key; value may itself contain '='
bool split_assignment(const std::string& s, std::string& key, std::string& value)
{
    auto eq = s.find('=');
    if (eq == std::string::npos || eq == 0)
        return false;
    key = s.substr(0, eq);
    value = s.substr(eq + 1);
    return true;
}

FlagSpec no_value(std::function<void(FlagTarget&)> fn)
{
    return FlagSpec{false, [fn](FlagTarget& t, const std::string&)
                    {
                        fn(t);
                        return true;
                    }};
}

FlagSpec with_value(std::function<bool(FlagTarget&, const std::string&)> fn)
{
    return FlagSpec{true, std::move(fn)};
}

FlagSpec set_string(const char* key, bool on_host)
{
    return with_value(
        [key, on_host](FlagTarget& t, const std::string& v)
        {
            (on_host ? t.host : t.body)[key] = v;
            return true;
        });
}

FlagSpec push_string(const char* key)
{
    return with_value(
        [key](FlagTarget& t, const std::string& v)
        {
            append(t.host, key, v);
            return true;
        });
}

std::map<std::string, FlagSpec> build_flag_table()
{
    std::map<std::string, FlagSpec> table;
    auto alias = [&table](std::initializer_list<const char*> names, const FlagSpec& spec)
    {
        for (const char* n : names)
            table.emplace(n, spec);
    };

    alias({"--rm"}, no_value([](FlagTarget& t) { t.host["AutoRemove"] = true; }));
    alias({"-i", "--interactive"}, no_value([](FlagTarget&) {}));
    alias({"-t", "--tty"}, no_value([](FlagTarget& t) { t.body["Tty"] = true; }));
    alias({"--privileged"}, no_value([](FlagTarget& t) { t.host["Privileged"] = true; }));

    alias({"--mount"}, with_value(
                           [](FlagTarget& t, const std::string& v)
                           {
                               auto mount = parse_mount_spec(v);
                               if (!mount)
                                   return false;
                               append(t.host, "Mounts", *mount);
                               return true;
                           }));
    alias({"-v", "--volume"}, push_string("Binds"));
    alias({"--tmpfs"}, with_value(
                           [](FlagTarget& t, const std::string& v)
                           {
                               auto colon = v.find(':');
                               std::string target = v.substr(0, colon);
                               if (target.empty())
                                   return false;
                               if (!t.host.contains("Tmpfs"))
                                   t.host["Tmpfs"] = Json::object();
                               t.host["Tmpfs"][target] =
                                   colon == std::string::npos ? "" : v.substr(colon + 1);
                               return true;
                           }));
    alias({"-e", "--env"}, with_value(
                               [](FlagTarget& t, const std::string& v)
                               {
                                   t.env.push_back(v);
                                   return true;
                               }));
    alias({"--env-file"}, with_value(
                              [](FlagTarget& t, const std::string& v)
                              {
                                  try
                                  {
                                      auto lines = read_env_file(v);
                                      t.env.insert(t.env.end(), lines.begin(), lines.end());
                                      return true;
                                  }
                                  catch (const ConfigError&)
                                  {
                                      return false;
                                  }
                              }));
    alias({"--network"}, set_string("NetworkMode", true));
    alias({"-u", "--user"}, set_string("User", false));
    alias({"-w", "--workdir"}, set_string("WorkingDir", false));
    alias({"--entrypoint"}, with_value(
                                [](FlagTarget& t, const std::string& v)
                                {
                                    Json parts = Json::array();
                                    for (auto& p : split(v, ' '))
                                        if (!p.empty())
                                            parts.push_back(p);
                                    t.body["Entrypoint"] = parts;
                                    return true;
                                }));
    alias({"--gpus"}, with_value(
                          [](FlagTarget& t, const std::string& v)
                          {
                              Json req = {{"Capabilities", Json::array({Json::array({"gpu"})})}};
                              if (v == "all")
                              {
                                  req["Count"] = -1;
                              }
                              else if (v.rfind("device=", 0) == 0)
                              {
                                  Json ids = Json::array();
                                  for (auto& id : split(v.substr(7), ','))
                                      if (!trim(id).empty())
                                          ids.push_back(trim(id));
                                  req["DeviceIDs"] = ids;
                              }
                              else
                              {
                                  // At most nine digits always fits an int
                                  if (!all_digits(v) || v.size() > 9)
                                      return false;
                                  req["Count"] = std::stoi(v);
                              }
                              append(t.host, "DeviceRequests", req);
                              return true;
                          }));
    alias({"--shm-size"}, with_value(
                              [](FlagTarget& t, const std::string& v)
                              {
                                  auto bytes = parse_byte_size(v);
                                  if (!bytes)
                                      return false;
                                  t.host["ShmSize"] = *bytes;
                                  return true;
                              }));
    alias({"--add-host"}, push_string("ExtraHosts"));
    alias({"--security-opt"}, push_string("SecurityOpt"));
    alias({"--sysctl"}, with_value(
                            [](FlagTarget& t, const std::string& v)
                            {
                                std::string key, value;
                                if (!split_assignment(v, key, value))
                                    return false;
                                if (!t.host.contains("Sysctls"))
                                    t.host["Sysctls"] = Json::object();
                                t.host["Sysctls"][key] = value;
                                return true;
                            }));
    alias({"--cap-add"}, push_string("CapAdd"));
    alias({"--cap-drop"}, push_string("CapDrop"));
    alias({"--ipc"}, set_string("IpcMode", true));
    alias({"--pid"}, set_string("PidMode", true));
    // The container name comes from configuration
    alias({"--name"}, with_value([](FlagTarget&, const std::string&) { return true; }));
    alias({"-l", "--label"}, with_value(
                                 [](FlagTarget& t, const std::string& v)
                                 {
                                     auto eq = v.find('=');
                                     std::string key = v.substr(0, eq);
                                     if (key.empty())
                                         return false;
                                     if (!t.body.contains("Labels"))
                                         t.body["Labels"] = Json::object();
                                     t.body["Labels"][key] =
                                         eq == std::string::npos ? "" : v.substr(eq + 1);
                                     return true;
                                 }));
    return table;
}

Json string_array(const Json& v)
{
    if (v.is_array())
        return v;
    if (v.is_string())
        return Json::array({v});
    return Json::array();
}
} // namespace

const std::map<std::string, FlagSpec>& flag_table()
{
    static const std::map<std::string, FlagSpec> table = build_flag_table();
    return table;
}

bool CreateOptions::auto_remove() const
{
    if (!body.contains("HostConfig"))
        return false;
    return body["HostConfig"].value("AutoRemove", false);
}

CreateOptions build_create_options(const client::RemoteServerConfig& cfg,
                                   const std::optional<std::string>& name, bool remove_on_exit)
{
    CreateOptions out;
    out.name = name;
    out.body = Json{{"Image", cfg.image},
                    {"AttachStdin", true},
                    {"AttachStdout", true},
                    {"AttachStderr", true},
                    {"OpenStdin", true},
                    {"StdinOnce", false},
                    {"Tty", false},
                    {"HostConfig", Json{{"AutoRemove", remove_on_exit}}}};
    if (!cfg.container_command.empty())
        out.body["Cmd"] = cfg.container_command;

    std::vector<std::string> env;
    for (const auto& [key, value] : cfg.env)
        env.push_back(key + "=" + value);

    Json host = out.body["HostConfig"];
    FlagTarget target{out.body, host, env};
    const auto& table = flag_table();
    const auto& args = cfg.container_args;

    for (size_t i = 0; i < args.size(); ++i)
    {
        std::string flag = args[i];
        std::optional<std::string> inline_value;
        if (flag.rfind("--", 0) == 0)
        {
            auto eq = flag.find('=');
            if (eq != std::string::npos)
            {
                inline_value = flag.substr(eq + 1);
                flag = flag.substr(0, eq);
            }
        }

        auto it = table.find(flag);
        if (it == table.end() || (inline_value && !it->second.takes_value))
        {
            out.unsupported.push_back(args[i]);
            continue;
        }

        std::string value;
        if (it->second.takes_value)
        {
            if (inline_value)
            {
                value = *inline_value;
            }
            else
            {
                if (i + 1 >= args.size() || args[i + 1].empty())
                {
                    out.unsupported.push_back(flag);
                    continue;
                }
                value = args[++i];
            }
        }

        if (!it->second.apply(target, value))
            out.unsupported.push_back(flag + "=" + value);
    }
    out.body["HostConfig"] = host;

    std::vector<std::string> unique_env;
    std::set<std::string> seen;
    for (auto& e : env)
        if (seen.insert(e).second)
            unique_env.push_back(e);
    if (!unique_env.empty())
        out.body["Env"] = unique_env;

    return out;
}

std::string compute_signature(const Json& body)
{
    // The whole translated body minus labels and auto-remove; list order is ignored
    Json payload = body;
    payload.erase("Labels");
    payload["Entrypoint"] = string_array(body.value("Entrypoint", Json()));
    payload["Cmd"] = string_array(body.value("Cmd", Json()));

    auto sort_array = [](Json& v)
    {
        if (!v.is_array())
            return;
        std::vector<std::string> keys;
        std::map<std::string, Json> by_key;
        for (const auto& item : v)
        {
            std::string key = item.is_string() ? item.get<std::string>() : item.dump();
            if (by_key.emplace(key, item).second)
                keys.push_back(key);
        }
        std::sort(keys.begin(), keys.end());
        Json sorted = Json::array();
        for (const auto& key : keys)
            sorted.push_back(by_key[key]);
        v = sorted;
    };

    if (payload.contains("Env"))
        sort_array(payload["Env"]);
    if (payload.contains("HostConfig") && payload["HostConfig"].is_object())
    {
        Json& host = payload["HostConfig"];
        host.erase("AutoRemove");
        for (const char* key : {"Mounts", "Binds", "CapAdd", "CapDrop", "ExtraHosts", "SecurityOpt",
                                "DeviceRequests"})
        {
            if (host.contains(key))
                sort_array(host[key]);
        }
    }

    const std::string text = payload.dump();
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_Digest(text.data(), text.size(), digest, &digest_len, EVP_sha1(), nullptr) != 1)
        throw Error("SHA-1 digest failed");

    std::ostringstream hex;
    for (unsigned int i = 0; i < digest_len; ++i)
        hex << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    return hex.str();
}

void apply_managed_labels(Json& body, const std::string& server, const std::string& signature)
{
    if (!body.contains("Labels") || !body["Labels"].is_object())
        body["Labels"] = Json::object();
    body["Labels"][LABEL_MANAGED] = "true";
    body["Labels"][LABEL_SERVER] = server;
    body["Labels"][LABEL_SIGNATURE] = signature;
}

std::optional<Json> parse_mount_spec(const std::string& spec)
{
    Json mount = {{"Type", "volume"}, {"Source", ""}, {"Target", ""}};

    for (auto& raw : split(spec, ','))
    {
        std::string part = trim(raw);
        if (part.empty())
            continue;
        std::string key, value;
        if (!split_assignment(part, key, value))
        {
            key = part;
            value = "true";
        }
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (key == "type")
            mount["Type"] = value;
        else if (key == "source" || key == "src")
            mount["Source"] = value;
        else if (key == "target" || key == "dst" || key == "destination")
            mount["Target"] = value;
        else if (key == "readonly" || key == "ro")
            mount["ReadOnly"] = (value != "false" && value != "0");
        else if (key == "rw")
            mount["ReadOnly"] = false;
        else if (key == "consistency")
            mount["Consistency"] = value;
        else if (key == "propagation")
            mount["BindOptions"] = Json{{"Propagation", value}};
    }

    if (mount["Target"].get<std::string>().empty())
        return std::nullopt;
    if (mount["Type"] == "bind" && mount["Source"].get<std::string>().empty())
        return std::nullopt;
    return mount;
}

std::optional<long long> parse_byte_size(const std::string& value)
{
    static const std::regex re(R"(^(\d+(?:\.\d+)?)([kKmMgGtTpPeE]?)[bB]?$)");
    std::smatch m;
    const std::string v = trim(value);
    if (!std::regex_match(v, m, re))
        return std::nullopt;

    const double numeric = std::strtod(m[1].str().c_str(), nullptr);
    const char unit =
        m[2].length() ? static_cast<char>(std::toupper(static_cast<unsigned char>(m[2].str()[0]))) : '\0';
    static const std::string units = "KMGTPE";
    double multiplier = 1;
    if (unit != '\0')
        multiplier = std::pow(1024.0, static_cast<double>(units.find(unit) + 1));
    const double bytes = std::floor(numeric * multiplier);
    // 2^63 is the first value that no longer fits a long long
    if (!std::isfinite(bytes) || bytes >= 9223372036854775808.0)
        return std::nullopt;
    return static_cast<long long>(bytes);
}

std::vector<std::string> read_env_file(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        throw ConfigError("Cannot read env file: " + path);

    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line))
    {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        out.push_back(line);
    }
    return out;
}

} // namespace mcpgate::container
