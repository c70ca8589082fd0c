#pragma once

namespace mdshield {

template <typename... Fs>
struct overloaded : Fs...
{
    using Fs::operator()...;
};

template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

} // namespace mdshield
