#pragma once

#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

#include <yyjson.h>

namespace pb::json {

class Document {
public:
  Document() = default;
  explicit Document(yyjson_doc *doc) : doc_(doc) {}
  Document(Document &&other) noexcept : doc_(other.doc_) { other.doc_ = nullptr; }
  Document &operator=(Document &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  Document(Document const &) = delete;
  Document &operator=(Document const &) = delete;

  ~Document() { reset(); }

  static Document parse(std::string_view payload) {
    return Document(yyjson_read(payload.data(), payload.size(),
                                static_cast<yyjson_read_flag>(0)));
  }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_val *root() const noexcept {
    return doc_ ? yyjson_doc_get_root(doc_) : nullptr;
  }

  // Root value when it is an object, nullptr otherwise.
  yyjson_val *object_root() const noexcept {
    auto *value = root();
    return (value != nullptr && yyjson_is_obj(value)) ? value : nullptr;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_doc *doc_ = nullptr;
};

class MutableDocument {
public:
  MutableDocument() : doc_(yyjson_mut_doc_new(nullptr)) {}
  MutableDocument(MutableDocument &&other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }
  MutableDocument &operator=(MutableDocument &&other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }
  MutableDocument(MutableDocument const &) = delete;
  MutableDocument &operator=(MutableDocument const &) = delete;

  ~MutableDocument() { reset(); }

  bool is_valid() const noexcept { return doc_ != nullptr; }
  yyjson_mut_doc *doc() const noexcept { return doc_; }
  yyjson_mut_val *root() const noexcept {
    return doc_ ? yyjson_mut_doc_get_root(doc_) : nullptr;
  }

  void set_root(yyjson_mut_val *value) {
    if (doc_) {
      yyjson_mut_doc_set_root(doc_, value);
    }
  }

  std::string write(char const *fallback = "{}") const {
    if (!doc_) {
      return fallback ? fallback : "{}";
    }
    char *json = yyjson_mut_write(doc_, 0, nullptr);
    std::string result = json ? json : (fallback ? fallback : "{}");
    std::free(json);
    return result;
  }

private:
  void reset() {
    if (doc_) {
      yyjson_mut_doc_free(doc_);
      doc_ = nullptr;
    }
  }

  yyjson_mut_doc *doc_ = nullptr;
};

// Member accessors tolerant of missing keys and JSON null.
inline std::optional<std::string> string_member(yyjson_val *object,
                                                char const *key) {
  if (object == nullptr || !yyjson_is_obj(object)) {
    return std::nullopt;
  }
  auto *value = yyjson_obj_get(object, key);
  if (value == nullptr || !yyjson_is_str(value)) {
    return std::nullopt;
  }
  return std::string(yyjson_get_str(value), yyjson_get_len(value));
}

inline std::optional<std::int64_t> int_member(yyjson_val *object,
                                              char const *key) {
  if (object == nullptr || !yyjson_is_obj(object)) {
    return std::nullopt;
  }
  auto *value = yyjson_obj_get(object, key);
  if (value == nullptr) {
    return std::nullopt;
  }
  if (yyjson_is_sint(value)) {
    return yyjson_get_sint(value);
  }
  if (yyjson_is_uint(value)) {
    auto raw = yyjson_get_uint(value);
    if (raw > static_cast<std::uint64_t>(
                  std::numeric_limits<std::int64_t>::max())) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(raw);
  }
  if (yyjson_is_real(value)) {
    // [-2^63, 2^63) is exactly the range that converts without overflow.
    constexpr double kLimit = 9223372036854775808.0;
    auto raw = yyjson_get_real(value);
    if (!(raw >= -kLimit && raw < kLimit)) {
      return std::nullopt;
    }
    return static_cast<std::int64_t>(raw);
  }
  return std::nullopt;
}

inline std::optional<bool> bool_member(yyjson_val *object, char const *key) {
  if (object == nullptr || !yyjson_is_obj(object)) {
    return std::nullopt;
  }
  auto *value = yyjson_obj_get(object, key);
  if (value == nullptr || !yyjson_is_bool(value)) {
    return std::nullopt;
  }
  return yyjson_get_bool(value);
}

} // namespace pb::json
