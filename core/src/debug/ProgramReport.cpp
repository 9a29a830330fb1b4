#include "luma/debug/ProgramReport.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <vector>

namespace luma {

std::string programReportJson(const ShaderProgram& program) {
  std::vector<std::string> attribNames;
  for (const auto& kv : program.attributes()) attribNames.push_back(kv.first);
  std::sort(attribNames.begin(), attribNames.end());

  std::vector<std::string> uniformNames;
  for (const auto& kv : program.uniforms()) uniformNames.push_back(kv.first);
  std::sort(uniformNames.begin(), uniformNames.end());

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("ok");
  w.Bool(true);
  w.Key("program");
  w.Uint(program.id());

  w.Key("attributes");
  w.StartArray();
  for (const auto& name : attribNames) {
    w.StartObject();
    w.Key("name");
    w.String(name.c_str());
    w.Key("location");
    w.Int(program.attributes().at(name));
    w.EndObject();
  }
  w.EndArray();

  w.Key("uniforms");
  w.StartArray();
  for (const auto& name : uniformNames) {
    const UniformSetter& s = program.uniforms().at(name);
    w.StartObject();
    w.Key("name");
    w.String(name.c_str());
    w.Key("kind");
    w.String(uniformKindName(s.kind()));
    w.Key("array");
    w.Bool(s.isArray());
    w.Key("size");
    w.Int(s.arraySize());
    w.Key("location");
    w.Int(s.location());
    w.EndObject();
  }
  w.EndArray();

  w.EndObject();
  return sb.GetString();
}

std::string programErrorJson(const ProgramError& err) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  w.StartObject();
  w.Key("ok");
  w.Bool(false);
  w.Key("code");
  w.String(errcName(err.code));
  w.Key("message");
  w.String(err.message.c_str());
  w.Key("path");
  w.String(err.path.c_str());
  w.EndObject();
  return sb.GetString();
}

} // namespace luma
