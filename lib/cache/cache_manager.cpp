// cnext/cache/cache_manager.cpp - Persistent header symbol cache

#include "cnext/cache/cache_manager.hpp"

#include <fstream>
#include <optional>
#include <system_error>

#include <nlohmann/json.hpp>

namespace cnext
{

using json = nlohmann::json;

// ============================================================================
// JSON mapping
// ============================================================================

NLOHMANN_JSON_SERIALIZE_ENUM(
  TypeKind, {
              {TypeKind::Void, "void"},
              {TypeKind::Bool, "bool"},
              {TypeKind::Integer, "integer"},
              {TypeKind::Float, "float"},
              {TypeKind::CString, "cstring"},
              {TypeKind::String, "string"},
              {TypeKind::Struct, "struct"},
              {TypeKind::Enum, "enum"},
              {TypeKind::Bitmap, "bitmap"},
              {TypeKind::Opaque, "opaque"},
            })

NLOHMANN_JSON_SERIALIZE_ENUM(
  SourceLanguage, {
                    {SourceLanguage::CNext, "cnext"},
                    {SourceLanguage::C, "c"},
                    {SourceLanguage::Cpp, "cpp"},
                  })

void to_json(json & j, const TypeInfo & t)
{
  j = json{
    {"kind", t.kind},         {"base", t.baseType},     {"bits", t.bitWidth},
    {"signed", t.isSigned},   {"dims", t.arrayDims},    {"const", t.isConst},
    {"pointer", t.isPointer}, {"capacity", t.stringCapacity},
  };
}

void from_json(const json & j, TypeInfo & t)
{
  j.at("kind").get_to(t.kind);
  j.at("base").get_to(t.baseType);
  j.at("bits").get_to(t.bitWidth);
  j.at("signed").get_to(t.isSigned);
  j.at("dims").get_to(t.arrayDims);
  j.at("const").get_to(t.isConst);
  j.at("pointer").get_to(t.isPointer);
  j.at("capacity").get_to(t.stringCapacity);
  t.isArray = !t.arrayDims.empty();
  t.isString = t.kind == TypeKind::String;
}

void to_json(json & j, const IncludeDirective & inc)
{
  j = json{
    {"path", inc.path}, {"system", inc.isSystem}, {"offset", inc.offset},
    {"end", inc.end},   {"line", inc.line},
  };
}

void from_json(const json & j, IncludeDirective & inc)
{
  j.at("path").get_to(inc.path);
  j.at("system").get_to(inc.isSystem);
  j.at("offset").get_to(inc.offset);
  j.at("end").get_to(inc.end);
  j.at("line").get_to(inc.line);
}

namespace
{

json details_to_json(const Symbol & sym)
{
  json d = json::object();
  if (const auto * fn = sym.as<FunctionInfo>()) {
    d["return"] = fn->returnType;
    d["definition"] = fn->isDefinition;
    d["variadic"] = fn->isVariadic;
    json params = json::array();
    for (const auto & p : fn->params) {
      params.push_back(
        json{{"name", p.name}, {"type", p.type}, {"writes", p.writesThroughPointer}});
    }
    d["params"] = std::move(params);
  } else if (const auto * st = sym.as<StructInfo>()) {
    d["complete"] = st->isComplete;
    json fields = json::array();
    for (const auto & f : st->fields) {
      fields.push_back(json{{"name", f.name}, {"type", f.type}});
    }
    d["fields"] = std::move(fields);
  } else if (const auto * en = sym.as<EnumInfo>()) {
    json members = json::array();
    for (const auto & m : en->members) {
      members.push_back(json{{"name", m.name}, {"value", m.value}});
    }
    d["members"] = std::move(members);
  } else if (const auto * td = sym.as<TypedefInfo>()) {
    d["aliased"] = td->aliased;
  } else if (const auto * mac = sym.as<MacroInfo>()) {
    d["value"] = mac->value;
    if (mac->intValue) d["int"] = *mac->intValue;
  } else if (const auto * var = sym.as<VariableInfo>()) {
    d["extern"] = var->isExtern;
  }
  return d;
}

SymbolDetails details_from_json(SymbolKind kind, const json & d)
{
  switch (kind) {
    case SymbolKind::Function: {
      FunctionInfo fn;
      d.at("return").get_to(fn.returnType);
      d.at("definition").get_to(fn.isDefinition);
      d.at("variadic").get_to(fn.isVariadic);
      for (const auto & p : d.at("params")) {
        ParamInfo param;
        p.at("name").get_to(param.name);
        p.at("type").get_to(param.type);
        p.at("writes").get_to(param.writesThroughPointer);
        fn.params.push_back(std::move(param));
      }
      return fn;
    }
    case SymbolKind::Struct: {
      StructInfo st;
      d.at("complete").get_to(st.isComplete);
      for (const auto & f : d.at("fields")) {
        st.fields.push_back(
          FieldInfo{f.at("name").get<std::string>(), f.at("type").get<TypeInfo>()});
      }
      return st;
    }
    case SymbolKind::Enum: {
      EnumInfo en;
      for (const auto & m : d.at("members")) {
        en.members.push_back(
          EnumeratorInfo{m.at("name").get<std::string>(), m.at("value").get<int64_t>()});
      }
      return en;
    }
    case SymbolKind::Typedef: {
      TypedefInfo td;
      d.at("aliased").get_to(td.aliased);
      return td;
    }
    case SymbolKind::Macro: {
      MacroInfo mac;
      d.at("value").get_to(mac.value);
      if (d.contains("int")) mac.intValue = d.at("int").get<int64_t>();
      return mac;
    }
    case SymbolKind::Variable: {
      VariableInfo var;
      d.at("extern").get_to(var.isExtern);
      return var;
    }
  }
  return VariableInfo{};
}

json symbol_to_json(const Symbol & sym)
{
  return json{
    {"name", sym.name},
    {"kind", std::string(to_string(sym.kind()))},
    {"language", sym.language},
    {"origin", sym.originFile},
    {"line", sym.line},
    {"type", sym.type},
    {"details", details_to_json(sym)},
  };
}

std::optional<SymbolKind> kind_from_string(const std::string & s)
{
  static constexpr SymbolKind k_kinds[] = {
    SymbolKind::Function, SymbolKind::Struct, SymbolKind::Enum,
    SymbolKind::Typedef,  SymbolKind::Macro,  SymbolKind::Variable,
  };
  for (const SymbolKind k : k_kinds) {
    if (to_string(k) == s) return k;
  }
  return std::nullopt;
}

std::optional<Symbol> symbol_from_json(const json & j)
{
  const auto kind = kind_from_string(j.at("kind").get<std::string>());
  if (!kind) {
    return std::nullopt;
  }
  Symbol sym;
  j.at("name").get_to(sym.name);
  j.at("language").get_to(sym.language);
  j.at("origin").get_to(sym.originFile);
  j.at("line").get_to(sym.line);
  j.at("type").get_to(sym.type);
  sym.details = details_from_json(*kind, j.at("details"));
  return sym;
}

}  // namespace

// ============================================================================
// CacheManager
// ============================================================================

bool CacheManager::load()
{
  namespace fs = std::filesystem;
  entries_.clear();

  std::error_code ec;
  if (!fs::exists(file_path(), ec)) {
    return true;
  }

  std::ifstream in(file_path());
  if (!in) {
    return false;
  }

  try {
    const json root = json::parse(in);
    if (root.at("version").get<int>() != k_format_version) {
      return false;
    }
    if (root.at("fingerprint").get<std::string>() != fingerprint_) {
      // Different search paths may resolve includes differently.
      return true;
    }
    for (const auto & f : root.at("files")) {
      CacheEntry entry;
      f.at("key").get_to(entry.key);
      const auto lang = language_from_string(f.at("language").get<std::string>());
      if (!lang) {
        entries_.clear();
        return false;
      }
      entry.language = *lang;
      f.at("mtime").get_to(entry.mtime);
      f.at("includes").get_to(entry.includes);
      f.at("dependencies").get_to(entry.dependencies);
      for (const auto & s : f.at("symbols")) {
        auto sym = symbol_from_json(s);
        if (!sym) {
          entries_.clear();
          return false;
        }
        entry.symbols.push_back(std::move(*sym));
      }
      std::string key = entry.key;
      entries_.emplace(std::move(key), std::move(entry));
    }
  } catch (const json::exception &) {
    entries_.clear();
    return false;
  }
  return true;
}

const CacheEntry * CacheManager::lookup(std::string_view key, int64_t mtime) const
{
  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.mtime != mtime) {
    return nullptr;
  }
  return &it->second;
}

void CacheManager::store(CacheEntry entry)
{
  std::string key = entry.key;
  entries_.insert_or_assign(std::move(key), std::move(entry));
}

CacheSaveResult CacheManager::save() const
{
  namespace fs = std::filesystem;

  json files = json::array();
  for (const auto & [key, entry] : entries_) {
    json symbols = json::array();
    for (const auto & s : entry.symbols) {
      symbols.push_back(symbol_to_json(s));
    }
    files.push_back(json{
      {"key", key},
      {"language", std::string(to_string(entry.language))},
      {"mtime", entry.mtime},
      {"includes", entry.includes},
      {"dependencies", entry.dependencies},
      {"symbols", std::move(symbols)},
    });
  }
  const json root = {
    {"version", k_format_version},
    {"fingerprint", fingerprint_},
    {"files", std::move(files)},
  };

  std::error_code ec;
  fs::create_directories(dir_, ec);
  if (ec) {
    return CacheSaveResult::fail(
      "cannot create cache directory " + dir_.string() + ": " + ec.message());
  }

  const fs::path tmp = dir_ / (std::string(k_cache_file_name) + ".tmp");
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      return CacheSaveResult::fail("cannot write " + tmp.string());
    }
    out << root.dump(1);
    if (!out) {
      return CacheSaveResult::fail("cannot write " + tmp.string());
    }
  }

  fs::rename(tmp, file_path(), ec);
  if (ec) {
    fs::remove(tmp, ec);
    return CacheSaveResult::fail("cannot replace " + file_path().string());
  }
  return CacheSaveResult::ok();
}

std::string CacheManager::fingerprint_for(const std::vector<std::filesystem::path> & search_paths)
{
  std::string out;
  for (const auto & p : search_paths) {
    out += std::filesystem::absolute(p).lexically_normal().generic_string();
    out += ';';
  }
  return out;
}

}  // namespace cnext
