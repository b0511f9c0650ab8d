//
// OmegaException.hpp
//

#ifndef BIGTWO_OMEGAEXCEPTION_HPP
#define BIGTWO_OMEGAEXCEPTION_HPP

#include <exception>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace bigtwo::core
{
    // An engine fault: a message, a typed code and the site that raised it.
    // Code is expected to be an enum; it is printed through its underlying value.
    template <typename Code>
    class OmegaException : public std::exception
    {
    public:
        OmegaException(std::string message,
                       Code code,
                       std::source_location site = std::source_location::current()) :
            message_{std::move(message)},
            code_{code},
            site_{site}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> char const* override { return message_.c_str(); }

        [[nodiscard]]
        auto message() const noexcept -> std::string const& { return message_; }

        [[nodiscard]]
        auto code() const noexcept -> Code { return code_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return site_; }

        // "file:line in function", for log lines
        [[nodiscard]]
        auto location() const -> std::string
        {
            return fmt::format("{}:{} in {}", site_.file_name(), site_.line(), site_.function_name());
        }

    private:
        std::string message_;
        Code code_;
        std::source_location site_;
    };
}

template <class Code>
struct fmt::formatter<bigtwo::core::OmegaException<Code>> : fmt::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(bigtwo::core::OmegaException<Code> const& e, FormatContext& ctx) const
    {
        std::string const s = fmt::format("[code {}] {} ({})",
                                          static_cast<unsigned>(e.code()), e.message(), e.location());
        return fmt::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //BIGTWO_OMEGAEXCEPTION_HPP
