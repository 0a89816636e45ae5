#pragma once

#include <string_view>

#include <NGIN/Python/Export.hpp>
#include <NGIN/Python/Types.hpp>
#include <NGIN/Python/Gil.hpp>
#include <NGIN/Python/Handle.hpp>
#include <NGIN/Python/Object.hpp>
#include <NGIN/Python/Error.hpp>
#include <NGIN/Python/Convert.hpp>
#include <NGIN/Python/Signature.hpp>
#include <NGIN/Python/ArgParse.hpp>
#include <NGIN/Python/Callback.hpp>
#include <NGIN/Python/Registry.hpp>
#include <NGIN/Python/Function.hpp>
#include <NGIN/Python/Class.hpp>
#include <NGIN/Python/Module.hpp>
#include <NGIN/Python/ModuleInit.hpp>

namespace NGIN::Python
{

    // For quick sanity checks / examples.
    [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "NGIN.Python"; }

} // namespace NGIN::Python
