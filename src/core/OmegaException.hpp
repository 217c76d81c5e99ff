//
// OmegaException.hpp
//

#ifndef CARDROLL_OMEGAEXCEPTION_HPP
#define CARDROLL_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <stacktrace>
#include <string>
#include <string_view>
#include <utility>

namespace cardroll::core
{
    // Error carrying a typed payload (usually an error::Code), the throw site and
    // the stack at the throw site. Not derived from std::exception: callers catch
    // it by its concrete type or as OmegaException<T>.
    template <typename T>
    class OmegaException
    {
    public:
        OmegaException(std::string err_str,
                       T usr_data,
                       std::source_location const& src_loc = std::source_location::current(),
                       std::stacktrace backtrace = std::stacktrace::current()) :
            err_str_{std::move(err_str)},
            usr_data_{std::move(usr_data)},
            src_loc_{src_loc},
            backtrace_{std::move(backtrace)}
        {
        }

        virtual ~OmegaException() = default;

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return err_str_; }

        [[nodiscard]]
        auto where() const noexcept -> std::source_location const& { return src_loc_; }

        [[nodiscard]]
        auto stack() const noexcept -> std::stacktrace const& { return backtrace_; }

        auto data() const noexcept -> T const& { return usr_data_; }

        // Throw site followed by the captured frames, one per line.
        [[nodiscard]]
        auto to_str() const -> std::string
        {
            std::string s = std::format("{}({}:{}), function `{}`\n", src_loc_.file_name(), src_loc_.line(),
                                        src_loc_.column(), src_loc_.function_name());
            for (auto const& frame : backtrace_)
            {
                s += std::format("{}({}):{}\n", frame.source_file(), frame.source_line(), frame.description());
            }
            return s;
        }

    private:
        std::string err_str_;
        T usr_data_;
        std::source_location src_loc_;
        std::stacktrace backtrace_;
    };
}

template <class T>
struct std::formatter<cardroll::core::OmegaException<T>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(cardroll::core::OmegaException<T> const& p, FormatContext& ctx) const
    {
        std::string s = std::format("Failed with code ({}): {}\n{}", static_cast<int>(p.data()), p.what(),
                                    p.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};

#endif //CARDROLL_OMEGAEXCEPTION_HPP
