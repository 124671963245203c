// =============================================================================
//  SEQUIN
//  
//  Copyright © 2008-present: The SEQUIN Authors
//            Please see the AUTHORS.md file.
//  
//  All rights reserved. This program and the accompanying materials
//  are made available under the terms of the GNU Public License v3.0 (or, at
//  your option, any later version) which accompanies this distribution, and
//  is available at http://www.gnu.org/licenses/gpl.html
// =============================================================================

/**
 * @file
 * Provides algorithms for graphs
 */

#ifndef LIBSEQUIN_GRAPHALGOS_HPP_
#define LIBSEQUIN_GRAPHALGOS_HPP_

#include <vector>

namespace sequin
{

namespace graph
{

/**
 * @brief Adjacency list of a directed graph with nodes @c 0, ..., @c n-1
 */
typedef std::vector<std::vector<int>> AdjacencyList;

/**
 * @brief      Converts connection list to adjacency list
 * @details    Duplicate edges are collapsed into one.
 *
 * @param      conList  Connection list (2 items per line: source node, destination node)
 * @param[in]  nNodes   Number of nodes
 * @param[in]  nCon     Number of connections in @p conList
 *
 * @return     Adjacency list for each node
 */
AdjacencyList adjacencyListFromConnectionList(int const* conList, int nNodes, int nCon);

/**
 * @brief      Performs a topological sort of the given directed graph
 * @details    Topological sorting finds an ordering of the nodes
 *             such that all predecessors of a node are listed before the
 *             node itself is listed.
 *
 *             In addition, cycles in the graph are detected.
 *
 *             Based on Cormen et al., Introduction to Algorithms (3rd ed.), Sec. 22.4
 *
 * @param[in]  adjList    List of adjacent nodes for each node, see adjacencyListFromConnectionList()
 * @param[out] topoOrder  Reverse topological order (last item has to be processed first)
 *
 * @return     @c true if the graph contains cycles, @c false otherwise
 */
bool topologicalSort(const AdjacencyList& adjList, std::vector<int>& topoOrder);

} // namespace graph

} // namespace sequin

#endif // LIBSEQUIN_GRAPHALGOS_HPP_
