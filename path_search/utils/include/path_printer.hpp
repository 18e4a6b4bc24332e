#ifndef PATH_SEARCH_PATH_PRINTER_HPP
#define PATH_SEARCH_PATH_PRINTER_HPP

#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "graph.hpp"
#include "search.hpp"


namespace path_search {


/// @brief Join the payloads of a path
/// @param steps Payloads in visiting order
/// @param separator Text put between two payloads
template <typename T>
std::string format_path(const std::vector<T>& steps, const std::string& separator = " -> ") {
    std::ostringstream oss;
    for (auto it = steps.begin(); it != steps.end(); ++it) {
        oss << *it;
        if (std::next(it) != steps.end())
            oss << separator;
    }
    return oss.str();
}


// Runs the search and writes a single line summary to out.
template <typename T>
std::optional<Path<T>> report_search(ISearch<T>& search, const T& start, const T& goal, std::ostream& out = std::cout) {
    std::optional<Path<T>> path_opt = search.execute(start, goal);
    if (!path_opt) {
        out << search.name() << ": no path" << std::endl;
        return path_opt;
    }

    out << search.name() << ": " << format_path(path_opt->steps)
        << " (distance " << path_opt->distance << ")" << std::endl;
    return path_opt;
}


}  // namespace path_search


#endif  // PATH_SEARCH_PATH_PRINTER_HPP
