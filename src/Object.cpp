#include <NGIN/Python/Object.hpp>
#include <NGIN/Python/Error.hpp>

#include <utility>

namespace NGIN::Python
{

  namespace
  {
    std::expected<Owned<Str>, Error> NameObject(GilToken gil, std::string_view name)
    {
      return Str::New(gil, name);
    }

    std::expected<std::string, Error> ToStdString(GilToken gil, PyObject *text)
    {
      auto owned = OwnedOrFetch<Str>(gil, text);
      if (!owned)
        return std::unexpected(std::move(owned.error()));
      auto utf8 = (*owned)->ToUtf8(gil);
      if (!utf8)
        return std::unexpected(std::move(utf8.error()));
      return std::string{*utf8};
    }
  } // namespace

  // Object
  std::expected<Owned<Object>, Error> Object::GetAttr(GilToken gil, std::string_view name) const
  {
    auto key = NameObject(gil, name);
    if (!key)
      return std::unexpected(std::move(key.error()));
    return OwnedOrFetch(gil, PyObject_GetAttr(m_ptr, key->Get()));
  }

  std::expected<void, Error> Object::SetAttr(GilToken gil, std::string_view name, Borrowed<Object> value) const
  {
    auto key = NameObject(gil, name);
    if (!key)
      return std::unexpected(std::move(key.error()));
    if (PyObject_SetAttr(m_ptr, key->Get(), value.Get()) < 0)
      return std::unexpected(Error::Fetch(gil));
    return {};
  }

  std::expected<bool, Error> Object::HasAttr(GilToken gil, std::string_view name) const
  {
    auto key = NameObject(gil, name);
    if (!key)
      return std::unexpected(std::move(key.error()));
    return PyObject_HasAttr(m_ptr, key->Get()) != 0;
  }

  std::expected<Owned<Object>, Error> Object::Call(GilToken gil, Borrowed<Tuple> args,
                                                   std::optional<Borrowed<Dict>> kwargs) const
  {
    PyObject *kw = kwargs ? kwargs->Get() : nullptr;
    return OwnedOrFetch(gil, PyObject_Call(m_ptr, args.Get(), kw));
  }

  std::expected<Owned<Object>, Error> Object::Call(GilToken gil) const
  {
    return OwnedOrFetch(gil, PyObject_CallNoArgs(m_ptr));
  }

  std::expected<std::string, Error> Object::Repr(GilToken gil) const
  {
    return ToStdString(gil, PyObject_Repr(m_ptr));
  }

  std::expected<std::string, Error> Object::ToString(GilToken gil) const
  {
    return ToStdString(gil, PyObject_Str(m_ptr));
  }

  // Str
  std::expected<Owned<Str>, Error> Str::New(GilToken gil, std::string_view text)
  {
    return OwnedOrFetch<Str>(gil, PyUnicode_FromStringAndSize(text.data(), static_cast<Py_ssize_t>(text.size())));
  }

  std::expected<std::string_view, Error> Str::ToUtf8(GilToken gil) const
  {
    Py_ssize_t size = 0;
    const char *data = PyUnicode_AsUTF8AndSize(m_ptr, &size);
    if (!data)
      return std::unexpected(Error::Fetch(gil));
    return std::string_view{data, static_cast<std::size_t>(size)};
  }

  // Tuple
  std::expected<Owned<Tuple>, Error> Tuple::New(GilToken gil, std::initializer_list<Borrowed<Object>> items)
  {
    auto tuple = OwnedOrFetch<Tuple>(gil, PyTuple_New(static_cast<Py_ssize_t>(items.size())));
    if (!tuple)
      return tuple;
    Py_ssize_t i = 0;
    for (const auto &item : items)
    {
      // PyTuple_SET_ITEM steals the reference taken here.
      PyTuple_SET_ITEM(tuple->Get(), i++, item.ClaimOwnership().IntoPtr());
    }
    return tuple;
  }

  std::expected<Owned<Tuple>, Error> Tuple::Empty(GilToken gil)
  {
    return OwnedOrFetch<Tuple>(gil, PyTuple_New(0));
  }

  Borrowed<Object> Tuple::GetItem(GilToken gil, Py_ssize_t index) const noexcept
  {
    return Borrowed<Object>::FromBorrowedPtr(gil, PyTuple_GET_ITEM(m_ptr, index));
  }

  std::expected<Owned<Tuple>, Error> Tuple::Slice(GilToken gil, Py_ssize_t from, Py_ssize_t to) const
  {
    return OwnedOrFetch<Tuple>(gil, PyTuple_GetSlice(m_ptr, from, to));
  }

  // Dict
  std::expected<Owned<Dict>, Error> Dict::New(GilToken gil)
  {
    return OwnedOrFetch<Dict>(gil, PyDict_New());
  }

  std::expected<std::optional<Borrowed<Object>>, Error> Dict::GetItem(GilToken gil, std::string_view key) const
  {
    auto k = NameObject(gil, key);
    if (!k)
      return std::unexpected(std::move(k.error()));
    PyObject *item = PyDict_GetItemWithError(m_ptr, k->Get());
    if (!item)
    {
      if (PyErr_Occurred())
        return std::unexpected(Error::Fetch(gil));
      return std::optional<Borrowed<Object>>{};
    }
    return std::optional<Borrowed<Object>>{Borrowed<Object>::FromBorrowedPtr(gil, item)};
  }

  std::expected<void, Error> Dict::SetItem(GilToken gil, std::string_view key, Borrowed<Object> value) const
  {
    auto k = NameObject(gil, key);
    if (!k)
      return std::unexpected(std::move(k.error()));
    return SetItem(gil, k->Borrow().Upcast<Object>(), value);
  }

  std::expected<void, Error> Dict::SetItem(GilToken gil, Borrowed<Object> key, Borrowed<Object> value) const
  {
    if (PyDict_SetItem(m_ptr, key.Get(), value.Get()) < 0)
      return std::unexpected(Error::Fetch(gil));
    return {};
  }

  std::optional<std::pair<Borrowed<Object>, Borrowed<Object>>> Dict::Next(GilToken gil, Py_ssize_t &pos) const noexcept
  {
    PyObject *key = nullptr;
    PyObject *value = nullptr;
    if (!PyDict_Next(m_ptr, &pos, &key, &value))
      return std::nullopt;
    return std::pair{Borrowed<Object>::FromBorrowedPtr(gil, key), Borrowed<Object>::FromBorrowedPtr(gil, value)};
  }

} // namespace NGIN::Python
