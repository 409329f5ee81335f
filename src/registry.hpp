#ifndef KEYREG_REGISTRY_HPP
#define KEYREG_REGISTRY_HPP

#include "error.hpp"
#include "event_sink.hpp"
#include "key_schema.hpp"
#include "record_layout.hpp"
#include "value.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace keyreg {

// Ordered sequence of records of type T, addressable by position or by the
// value of any declared key.
//
// For every key declaration whose type is not key_type::identifier, no two
// records hold the same value of the key's source attribute. Identifier keys
// are not checked; looking up an identifier held by several records throws
// ambiguous_key_error.
//
// Batch operations are not transactional: if an item fails, the items before
// it stay applied.
template <typename T>
class registry {
public:
  using value_type = T;
  using const_iterator = typename std::vector<T>::const_iterator;

  // Initial records are checked for uniqueness exactly as if they were
  // appended one by one.
  registry(record_layout<T> layout, key_schema keys,
           std::vector<T> initial = {}, event_sink* sink = nullptr)
    : layout_{std::move(layout)}
    , keys_{std::move(keys)}
    , sink_{sink}
  {
    bind_keys();

    records_.reserve(initial.size());
    for (T& record : initial) {
      check_unique(record);
      records_.push_back(std::move(record));
    }

    if (sink_)
      emit(registry_event_kind::constructed, std::nullopt,
           fmt::format("keys: {}", keys_));
  }

  record_layout<T> const&
  layout() const { return layout_; }

  key_schema const&
  keys() const { return keys_; }

  void
  set_event_sink(event_sink* sink) { sink_ = sink; }

  std::size_t
  size() const { return records_.size(); }

  bool
  empty() const { return records_.empty(); }

  const_iterator
  begin() const { return records_.begin(); }

  const_iterator
  end() const { return records_.end(); }

  std::vector<T> const&
  records() const { return records_; }

  // Throws duplicate_key_error if candidate shares a value of a
  // non-identifier key with any record other than the one at exclude.
  void
  check_unique(T const& candidate,
               std::optional<std::size_t> exclude = std::nullopt) const {
    for (std::size_t k = 0; k < key_attributes_.size(); ++k) {
      key_declaration const& decl = keys_.declarations()[k];
      if (decl.match_type == key_type::identifier)
        continue;

      attribute<T> const& attr = layout_.attributes()[key_attributes_[k]];
      attribute_value value = attr.get(candidate);
      for (std::size_t i = 0; i < records_.size(); ++i) {
        if (exclude && *exclude == i)
          continue;

        if (attr.get(records_[i]) == value) {
          if (sink_)
            emit(registry_event_kind::duplicate_rejected, i,
                 fmt::format("{} = {}", decl.projection_name, value));
          throw duplicate_key_error{decl.projection_name, std::move(value)};
        }
      }
    }
  }

  // Index of the record whose attribute equals k, searched through the
  // first key declaration matching k's type. Nothing if no record matches,
  // if no declaration has k's type, or if k is a position.
  std::optional<std::size_t>
  resolve_by_key(key const& k) const {
    std::optional<key_type> type = key_type_of(k);
    if (!type)
      return std::nullopt;

    key_declaration const* decl = keys_.find_for(*type);
    if (!decl) {
      if (sink_)
        emit(registry_event_kind::key_not_found, std::nullopt,
             fmt::format("no key of type {} for {}", *type, k));
      return std::nullopt;
    }

    attribute<T> const& attr = attribute_for(*decl);
    attribute_value value = *key_value(k);
    std::optional<std::size_t> result;
    for (std::size_t i = 0; i < records_.size(); ++i)
      if (attr.get(records_[i]) == value) {
        if (result)
          throw ambiguous_key_error{k, decl->projection_name};
        result = i;
      }

    if (sink_)
      emit(result ? registry_event_kind::key_resolved
                  : registry_event_kind::key_not_found,
           result,
           fmt::format("{} = {}", decl->projection_name, k));
    return result;
  }

  std::size_t
  resolve_index(key const& k) const {
    if (position const* p = match<position>(k)) {
      if (p->index < 0 || static_cast<std::size_t>(p->index) >= size())
        throw index_out_of_range{p->index, size()};
      return static_cast<std::size_t>(p->index);
    }

    if (std::optional<std::size_t> index = resolve_by_key(k))
      return *index;
    else
      throw key_not_found{k};
  }

  std::vector<std::size_t>
  resolve_indices(key const& k) const {
    return {resolve_index(k)};
  }

  std::vector<std::size_t>
  resolve_indices(std::vector<key> const& ks) const {
    std::vector<std::size_t> result;
    result.reserve(ks.size());
    for (key const& k : ks)
      result.push_back(resolve_index(k));
    return result;
  }

  bool
  contains(key const& k) const {
    if (position const* p = match<position>(k))
      return p->index >= 0 && static_cast<std::size_t>(p->index) < size();
    else
      return resolve_by_key(k).has_value();
  }

  T const&
  get(key const& k) const { return records_[resolve_index(k)]; }

  std::vector<T>
  get(std::vector<key> const& ks) const {
    std::vector<T> result;
    result.reserve(ks.size());
    for (std::size_t i : resolve_indices(ks))
      result.push_back(records_[i]);
    return result;
  }

  T const&
  operator [] (key const& k) const { return get(k); }

  void
  append(T record) {
    check_unique(record);
    records_.push_back(std::move(record));
    if (sink_)
      emit(registry_event_kind::appended, records_.size() - 1,
           layout_.describe(records_.back()));
  }

  void
  append(std::vector<T> records) {
    for (T& record : records)
      append(std::move(record));
  }

  void
  replace(key const& k, T value) {
    store(resolve_index(k), std::move(value));
  }

  void
  replace(std::vector<key> const& ks, std::vector<T> values) {
    std::vector<std::size_t> indices = resolve_indices(ks);
    if (indices.size() != values.size())
      throw count_mismatch_error{indices.size(), values.size()};

    for (std::size_t i = 0; i < indices.size(); ++i)
      store(indices[i], std::move(values[i]));
  }

  void
  erase(key const& k) {
    erase(std::vector<key>{k});
  }

  // Records are removed from the highest index down, so removing one never
  // shifts another that is yet to be removed. An index listed twice removes
  // two records: the one at that position and the one that moved into it.
  void
  erase(std::vector<key> const& ks) {
    std::vector<std::size_t> indices = resolve_indices(ks);
    std::ranges::sort(indices, std::greater<>{});

    for (std::size_t i : indices) {
      if (i >= records_.size())
        throw index_out_of_range{static_cast<std::int64_t>(i), size()};

      T removed = std::move(records_[i]);
      records_.erase(records_.begin() + static_cast<std::ptrdiff_t>(i));
      if (sink_)
        emit(registry_event_kind::erased, i, layout_.describe(removed));
    }
  }

  void
  clear() {
    records_.clear();
    if (sink_)
      emit(registry_event_kind::cleared, std::nullopt, {});
  }

  // Values of the attribute named by projection, in record order.
  std::vector<attribute_value>
  project(std::string_view projection) const {
    attribute<T> const* attr = layout_.find_projection(projection);
    if (!attr)
      throw attribute_not_found{std::string{projection}, layout_.type_name()};

    std::vector<attribute_value> result;
    result.reserve(records_.size());
    for (T const& record : records_)
      result.push_back(attr->get(record));
    return result;
  }

  bool
  has_projection(std::string_view projection) const {
    return layout_.find_projection(projection) != nullptr;
  }

  std::vector<std::string>
  projection_names() const { return layout_.projection_names(); }

  std::string
  describe() const {
    return fmt::format("Registry<{}>: {} records, keys: {}",
                       layout_.type_name(), size(), keys_);
  }

private:
  record_layout<T>         layout_;
  key_schema               keys_;
  std::vector<std::size_t> key_attributes_;
  std::vector<T>           records_;
  event_sink*              sink_;

  void
  bind_keys() {
    for (key_declaration const& decl : keys_) {
      std::optional<std::size_t> index
        = layout_.find_attribute(decl.source_attribute);
      if (!index)
        throw make_error<schema_error>(
          "Key '{}' refers to unknown attribute '{}' of {}",
          decl.projection_name, decl.source_attribute, layout_.type_name()
        );

      key_type actual = layout_.attributes()[*index].type;
      if (actual != decl.match_type)
        throw make_error<schema_error>(
          "Key '{}' matches {} values, but attribute '{}' of {} is {}",
          decl.projection_name, decl.match_type, decl.source_attribute,
          layout_.type_name(), actual
        );

      key_attributes_.push_back(*index);
    }
  }

  attribute<T> const&
  attribute_for(key_declaration const& decl) const {
    auto k = static_cast<std::size_t>(&decl - keys_.declarations().data());
    return layout_.attributes()[key_attributes_[k]];
  }

  void
  store(std::size_t index, T value) {
    check_unique(value, index);
    records_[index] = std::move(value);
    if (sink_)
      emit(registry_event_kind::replaced, index,
           layout_.describe(records_[index]));
  }

  void
  emit(registry_event_kind kind, std::optional<std::size_t> index,
       std::string detail) const {
    sink_->record(registry_event{kind, layout_.type_name(), index, size(),
                                 std::move(detail)});
  }
};

} // namespace keyreg

template <typename T>
struct fmt::formatter<keyreg::registry<T>> : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto
  format(keyreg::registry<T> const& r, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(r.describe(), ctx);
  }
};

#endif
