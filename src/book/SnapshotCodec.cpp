#include "tradesim/book/SnapshotCodec.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

#include <optional>

namespace tradesim {

static std::string stringMember(const rapidjson::Value& obj, const char* name) {
  auto it = obj.FindMember(name);
  if (it == obj.MemberEnd() || !it->value.IsString()) return {};
  return std::string(it->value.GetString(), it->value.GetStringLength());
}

// With kParseNumbersAsStringsFlag numeric literals arrive as strings too.
static std::optional<Decimal> decimalOf(const rapidjson::Value& v) {
  if (!v.IsString()) return std::nullopt;
  return parseDecimal(std::string(v.GetString(), v.GetStringLength()));
}

static std::optional<Error> parseSide(const rapidjson::Value& obj,
                                      const char* name,
                                      std::vector<Level>& out) {
  auto it = obj.FindMember(name);
  if (it == obj.MemberEnd() || it->value.IsNull()) return std::nullopt;

  const rapidjson::Value& arr = it->value;
  if (!arr.IsArray()) {
    return Error{"expected an array of [price, size] levels", name};
  }

  out.reserve(arr.Size());
  for (rapidjson::SizeType i = 0; i < arr.Size(); ++i) {
    const std::string path = std::string(name) + "[" + std::to_string(i) + "]";
    const rapidjson::Value& lv = arr[i];
    if (!lv.IsArray() || lv.Size() < 2) {
      return Error{"level must be a [price, size] array", path};
    }
    auto px = decimalOf(lv[0]);
    if (!px) return Error{"price is not a decimal number", path + "[0]"};
    auto sz = decimalOf(lv[1]);
    if (!sz) return Error{"size is not a decimal number", path + "[1]"};
    out.push_back(Level{std::move(*px), std::move(*sz)});
  }
  return std::nullopt;
}

Result<OrderBookSnapshot> parseSnapshot(const std::string& text) {
  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseNumbersAsStringsFlag>(text.c_str(), text.size());
  if (doc.HasParseError()) {
    return Error{std::string("malformed JSON: ") + rapidjson::GetParseError_En(doc.GetParseError()),
                 "offset " + std::to_string(doc.GetErrorOffset())};
  }
  if (!doc.IsObject()) {
    return Error{"frame must be a JSON object", ""};
  }

  OrderBookSnapshot snap;
  snap.timestamp = stringMember(doc, "timestamp");
  snap.exchange  = stringMember(doc, "exchange");
  snap.symbol    = stringMember(doc, "symbol");

  if (auto err = parseSide(doc, "asks", snap.asks)) return *err;
  if (auto err = parseSide(doc, "bids", snap.bids)) return *err;

  return snap;
}

} // namespace tradesim
