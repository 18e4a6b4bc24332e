#include <dijkstra.hpp>

#include <string>


namespace path_search {


template class Dijkstra<std::string>;
template class Dijkstra<int>;


}  // namespace path_search
