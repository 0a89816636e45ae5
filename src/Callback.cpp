#include <NGIN/Python/Callback.hpp>
#include <NGIN/Python/Gil.hpp>

#include <cstdio>
#include <cstdlib>

namespace NGIN::Python
{

  namespace
  {
    [[noreturn]] void AbortWith(std::string_view location, std::string_view reason) noexcept
    {
      std::fprintf(stderr, "NGIN.Python: fatal error in %.*s: %.*s\n",
                   static_cast<int>(location.size()), location.data(),
                   static_cast<int>(reason.size()), reason.data());
      std::fflush(stderr);
      std::abort();
    }
  } // namespace

  namespace detail
  {
    void AbortGilNotHeld() noexcept
    {
      AbortWith("GilToken::AssumeAcquired", "the calling thread does not hold the GIL");
    }
  } // namespace detail

  CallbackGuard::~CallbackGuard()
  {
    if (m_armed)
      AbortWith(m_location, "unwinding across the interpreter boundary");
  }

  void CallbackGuard::Panic(std::string_view reason) const noexcept
  {
    AbortWith(m_location, reason);
  }

} // namespace NGIN::Python
