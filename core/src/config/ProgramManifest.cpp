#include "luma/config/ProgramManifest.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <utility>

namespace luma {

static bool readNumber(const rapidjson::Value& v, float& out) {
  if (v.IsBool()) { out = v.GetBool() ? 1.0f : 0.0f; return true; }
  if (v.IsNumber()) { out = static_cast<float>(v.GetDouble()); return true; }
  return false;
}

static bool readString(const rapidjson::Value& doc, const char* key,
                       std::string& out, bool required, std::string& err) {
  if (!doc.HasMember(key)) {
    if (required) err = std::string("missing \"") + key + "\"";
    return !required;
  }
  if (!doc[key].IsString()) {
    err = std::string("\"") + key + "\" must be a string";
    return false;
  }
  out = doc[key].GetString();
  return true;
}

bool parseProgramManifest(const std::string& json, ProgramManifest& out, std::string& err) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError()) {
    err = std::string("JSON parse error at offset ") +
          std::to_string(doc.GetErrorOffset()) + ": " +
          rapidjson::GetParseError_En(doc.GetParseError());
    return false;
  }
  if (!doc.IsObject()) {
    err = "manifest must be a JSON object";
    return false;
  }

  ProgramManifest m;
  if (!readString(doc, "path", m.path, false, err)) return false;
  if (!readString(doc, "vs", m.vs, true, err)) return false;
  if (!readString(doc, "fs", m.fs, true, err)) return false;

  if (doc.HasMember("noCache")) {
    if (!doc["noCache"].IsBool()) {
      err = "\"noCache\" must be a boolean";
      return false;
    }
    m.noCache = doc["noCache"].GetBool();
  }

  if (doc.HasMember("uniforms")) {
    const auto& u = doc["uniforms"];
    if (!u.IsObject()) {
      err = "\"uniforms\" must be an object";
      return false;
    }
    for (auto it = u.MemberBegin(); it != u.MemberEnd(); ++it) {
      ManifestUniform mu;
      mu.name = it->name.GetString();

      const auto& v = it->value;
      float f = 0.0f;
      if (v.IsArray()) {
        for (const auto& e : v.GetArray()) {
          if (!readNumber(e, f)) {
            err = "uniform \"" + mu.name + "\" array must hold numbers or booleans";
            return false;
          }
          mu.values.push_back(f);
        }
      } else if (readNumber(v, f)) {
        mu.values.push_back(f);
      } else {
        err = "uniform \"" + mu.name + "\" must be a number, boolean or array";
        return false;
      }
      m.uniforms.push_back(std::move(mu));
    }
  }

  out = std::move(m);
  return true;
}

UniformAssignments manifestUniformValues(const ProgramManifest& manifest) {
  UniformAssignments values;
  values.reserve(manifest.uniforms.size());
  for (const auto& u : manifest.uniforms) {
    values.emplace_back(u.name, UniformValue(u.values));
  }
  return values;
}

} // namespace luma
