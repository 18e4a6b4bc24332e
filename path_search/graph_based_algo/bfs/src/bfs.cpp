#include <bfs.hpp>

#include <string>


namespace path_search {


template class BreadthFirstSearch<std::string>;
template class BreadthFirstSearch<int>;


}  // namespace path_search
