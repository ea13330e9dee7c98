#pragma once

#include <memory>
#include <string>
#include <type_traits>
#include <vector>

#include "object.hpp"

namespace aff4::object {

/*
  ObjectFactory

  Opens and creates handles. The concrete handle class follows the kind
  recorded in aff4:type, so opening a file yields a VfsFile even through
  the untyped Open().

  Typed Create<T>() / Open<T>() additionally require the stored kind to be
  T::kKind or one of its descendants.
*/
class ObjectFactory {
 public:
  explicit ObjectFactory(ObjectContext context);

  // Starts from an empty buffer whether or not the object exists. It
  // becomes visible to Open() after its first flush.
  std::unique_ptr<Object> Create(const urn::Urn& urn, const std::string& kind, Mode mode = Mode::kReadWrite);

  // Throws util::NotFound if nothing was ever written at `urn`.
  std::unique_ptr<Object> Open(const urn::Urn& urn, Mode mode = Mode::kRead, util::Timestamp as_of = store::kNewest);

  template <typename T>
  std::unique_ptr<T> Create(const urn::Urn& urn, Mode mode = Mode::kReadWrite) {
    static_assert(std::is_base_of_v<Object, T>);
    return Downcast<T>(Create(urn, T::kKind, mode));
  }

  template <typename T>
  std::unique_ptr<T> Open(const urn::Urn& urn, Mode mode = Mode::kRead, util::Timestamp as_of = store::kNewest) {
    static_assert(std::is_base_of_v<Object, T>);
    auto handle = Open(urn, mode, as_of);
    RequireKind(*handle, T::kKind);
    return Downcast<T>(std::move(handle));
  }

  bool Exists(const urn::Urn& urn);

  std::vector<urn::Urn> ListChildren(const urn::Urn& urn);

  const ObjectContext& Context() const {
    return ctx_;
  }

 private:
  std::unique_ptr<Object> Instantiate(const urn::Urn& urn, const std::string& kind, Mode mode, util::Timestamp as_of);

  void RequireKind(const Object& handle, const std::string& kind) const;

  template <typename T>
  static std::unique_ptr<T> Downcast(std::unique_ptr<Object> handle) {
    auto* typed = dynamic_cast<T*>(handle.get());
    if (!typed) {
      throw std::logic_error("handle for " + handle->Urn().Value() + " is not a " + T::kKind);
    }
    handle.release();
    return std::unique_ptr<T>(typed);
  }

  ObjectContext ctx_;
};

} // namespace aff4::object
