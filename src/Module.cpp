#include <NGIN/Python/Module.hpp>

#include <string>
#include <utility>

namespace NGIN::Python
{

  namespace
  {
    // Offset of the first invalid byte and the length of the bad sequence.
    struct Utf8Fault
    {
      std::size_t start;
      std::size_t length;
    };

    std::optional<Utf8Fault> ValidateUtf8(std::string_view s) noexcept
    {
      std::size_t i = 0;
      while (i < s.size())
      {
        const auto c = static_cast<unsigned char>(s[i]);
        std::size_t need = 0;
        unsigned int min = 0;
        unsigned int cp = 0;
        if (c < 0x80)
        {
          ++i;
          continue;
        }
        if ((c & 0xE0) == 0xC0)
        {
          need = 1;
          cp = c & 0x1F;
          min = 0x80;
        }
        else if ((c & 0xF0) == 0xE0)
        {
          need = 2;
          cp = c & 0x0F;
          min = 0x800;
        }
        else if ((c & 0xF8) == 0xF0)
        {
          need = 3;
          cp = c & 0x07;
          min = 0x10000;
        }
        else
          return Utf8Fault{i, 1};

        if (i + need >= s.size())
          return Utf8Fault{i, s.size() - i};
        for (std::size_t k = 1; k <= need; ++k)
        {
          const auto cc = static_cast<unsigned char>(s[i + k]);
          if ((cc & 0xC0) != 0x80)
            return Utf8Fault{i, k};
          cp = (cp << 6) | (cc & 0x3F);
        }
        if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
          return Utf8Fault{i, need + 1};
        i += need + 1;
      }
      return std::nullopt;
    }

    // Passes valid UTF-8 through; otherwise builds the UnicodeDecodeError instance.
    std::expected<std::string_view, Error> CheckUtf8(GilToken gil, std::string_view bytes)
    {
      const auto fault = ValidateUtf8(bytes);
      if (!fault)
        return bytes;
      PyObject *exc = PyUnicodeDecodeError_Create("utf-8", bytes.data(), static_cast<Py_ssize_t>(bytes.size()),
                                                  static_cast<Py_ssize_t>(fault->start),
                                                  static_cast<Py_ssize_t>(fault->start + fault->length),
                                                  "invalid utf-8 sequence");
      if (!exc)
        return std::unexpected(Error::Fetch(gil));
      return std::unexpected(Error::FromInstance(gil, Owned<Object>::FromOwnedPtr(gil, exc)));
    }
  } // namespace

  std::expected<Owned<Module>, Error> Module::New(GilToken gil, std::string_view name)
  {
    const std::string n{name};
    return OwnedOrFetch<Module>(gil, PyModule_New(n.c_str()));
  }

  std::expected<Owned<Module>, Error> Module::Import(GilToken gil, std::string_view name)
  {
    const std::string n{name};
    auto imported = OwnedOrFetch(gil, PyImport_ImportModule(n.c_str()));
    if (!imported)
      return std::unexpected(std::move(imported.error()));
    return Downcast<Module>(gil, std::move(*imported));
  }

  std::expected<std::string_view, Error> Module::Name(GilToken gil) const
  {
    const char *name = PyModule_GetName(m_ptr);
    if (!name)
      return std::unexpected(Error::FetchOr(gil, ErrorCode::AttributeError, "module has no __name__"));
    return CheckUtf8(gil, name);
  }

  std::expected<std::string, Error> Module::Filename(GilToken gil) const
  {
    auto file = OwnedOrFetch(gil, PyModule_GetFilenameObject(m_ptr));
    if (!file)
    {
      if (file.error().IsPythonException())
        return std::unexpected(std::move(file.error()));
      return std::unexpected(Error{ErrorCode::AttributeError, "module has no __file__"});
    }
    // Filesystem encoding with surrogateescape keeps undecodable names intact as bytes.
    auto encoded = OwnedOrFetch(gil, PyUnicode_EncodeFSDefault(file->Get()));
    if (!encoded)
      return std::unexpected(std::move(encoded.error()));
    char *data = nullptr;
    Py_ssize_t size = 0;
    if (PyBytes_AsStringAndSize(encoded->Get(), &data, &size) < 0)
      return std::unexpected(Error::Fetch(gil));
    auto checked = CheckUtf8(gil, std::string_view{data, static_cast<std::size_t>(size)});
    if (!checked)
      return std::unexpected(std::move(checked.error()));
    return std::string{*checked};
  }

  Borrowed<NGIN::Python::Dict> Module::GetDict(GilToken gil) const noexcept
  {
    return Borrowed<NGIN::Python::Dict>::FromBorrowedPtr(gil, PyModule_GetDict(m_ptr));
  }

  std::expected<Owned<Object>, Error> Module::Call(GilToken gil, std::string_view name, Borrowed<Tuple> args,
                                                   std::optional<Borrowed<NGIN::Python::Dict>> kwargs) const
  {
    auto fn = GetAttr(gil, name);
    if (!fn)
      return std::unexpected(std::move(fn.error()));
    return (*fn)->Call(gil, args, kwargs);
  }

} // namespace NGIN::Python
