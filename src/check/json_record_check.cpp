#include "stream_chunker/json_record_check.hpp"

#include <simdjson.h>
#include <string>

namespace sc {

namespace {

// On-demand parsing is lazy, so every value is visited to validate it.
void walk(simdjson::ondemand::value& v, std::size_t& members) {
  switch (v.type().value()) {
    case simdjson::ondemand::json_type::object: {
      simdjson::ondemand::object obj = v.get_object().value();
      for (auto field : obj) {
        (void)field.unescaped_key().value();
        simdjson::ondemand::value fv = field.value();
        walk(fv, members);
        ++members;
      }
      break;
    }
    case simdjson::ondemand::json_type::array: {
      simdjson::ondemand::array arr = v.get_array().value();
      for (auto er : arr) {
        simdjson::ondemand::value el = er.value();
        walk(el, members);
      }
      break;
    }
    case simdjson::ondemand::json_type::number:
      (void)v.get_double().value();
      break;
    case simdjson::ondemand::json_type::string:
      (void)v.get_string().value();
      break;
    case simdjson::ondemand::json_type::boolean:
      (void)v.get_bool().value();
      break;
    case simdjson::ondemand::json_type::null:
      if (!v.is_null()) throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
      break;
    default:
      throw simdjson::simdjson_error(simdjson::INCORRECT_TYPE);
  }
}

}

struct JsonRecordCheck::Impl {
  JsonCheckConfig cfg;
  simdjson::ondemand::parser parser;
  std::string scratch;

  explicit Impl(const JsonCheckConfig& c) : cfg(c) {}
};

JsonRecordCheck::JsonRecordCheck(const JsonCheckConfig& cfg)
  : p_(new Impl(cfg)) {}

JsonRecordCheck::~JsonRecordCheck() { delete p_; }

bool JsonRecordCheck::check(std::string_view record) {
  members_ = 0;
  err_.clear();

  std::string& scratch = p_->scratch;
  scratch.assign(record.data(), record.size());
  scratch.resize(record.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(scratch.data(), record.size(), scratch.size());

  try {
    simdjson::ondemand::document doc;
    auto error = p_->parser.iterate(view).get(doc);
    if (error) { err_ = simdjson::error_message(error); return false; }

    const auto t = doc.type().value();
    std::size_t members = 0;

    if (t == simdjson::ondemand::json_type::object) {
      simdjson::ondemand::object obj = doc.get_object().value();
      for (auto field : obj) {
        (void)field.unescaped_key().value();
        simdjson::ondemand::value fv = field.value();
        walk(fv, members);
        ++members;
      }
    } else if (p_->cfg.strict) {
      err_ = "strict mode: record is not a JSON object";
      return false;
    } else {
      switch (t) {
        case simdjson::ondemand::json_type::array: {
          simdjson::ondemand::array arr = doc.get_array().value();
          for (auto er : arr) {
            simdjson::ondemand::value el = er.value();
            walk(el, members);
          }
          break;
        }
        case simdjson::ondemand::json_type::number:
          (void)doc.get_double().value();
          break;
        case simdjson::ondemand::json_type::string:
          (void)doc.get_string().value();
          break;
        case simdjson::ondemand::json_type::boolean:
          (void)doc.get_bool().value();
          break;
        case simdjson::ondemand::json_type::null:
          if (!doc.is_null()) { err_ = "invalid null literal"; return false; }
          break;
        default:
          err_ = "unrecognized JSON value";
          return false;
      }
    }

    if (!doc.at_end()) {
      err_ = "trailing content after JSON value";
      return false;
    }
    members_ = members;
    return true;

  } catch (const simdjson::simdjson_error& e) {
    err_ = e.what();
    return false;
  }
}

}
