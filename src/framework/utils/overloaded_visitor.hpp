#ifndef _OUI_UTILS_OVERLOADED_VISITOR_HPP_
#define _OUI_UTILS_OVERLOADED_VISITOR_HPP_

namespace oui::utils {

/**
 * Build a std::visit visitor from a set of lambdas, one per alternative.
 */
template <typename... Ts> struct overloaded_visitor : Ts...
{
    overloaded_visitor(const Ts&... args)
        : Ts(args)...
    {}

    using Ts::operator()...;
};

} // namespace oui::utils

#endif /* _OUI_UTILS_OVERLOADED_VISITOR_HPP_ */
