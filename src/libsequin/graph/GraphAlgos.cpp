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

#include "graph/GraphAlgos.hpp"

#include <algorithm>

namespace sequin
{

namespace graph
{

	AdjacencyList adjacencyListFromConnectionList(int const* conList, int nNodes, int nCon)
	{
		AdjacencyList adj(nNodes);

		for (int j = 0; j < nCon; ++j)
		{
			const int from = conList[2*j];
			const int to = conList[2*j+1];

			std::vector<int>& adjNode = adj[from];
			if (std::find(adjNode.begin(), adjNode.end(), to) == adjNode.end())
				adjNode.push_back(to);
		}

		return adj;
	}

	namespace detail
	{

		bool topologicalSortHelper(const AdjacencyList& adjList, int u, std::vector<char>& colors, std::vector<int>& topoOrder)
		{
			// Set color to gray (1)
			colors[u] = 1;

			const std::vector<int>& adj = adjList[u];
			for (std::size_t n = 0; n < adj.size(); ++n)
			{
				const int nu = adj[n];
				if (colors[nu] == 0)
				{
					// Depth-first traversal
					// Escalate cycles to caller
					if (topologicalSortHelper(adjList, nu, colors, topoOrder))
						return true;
				}
				else if (colors[nu] == 1)
				{
					// Detected cycle
					return true;
				}
			}

			// Set color to black (2)
			colors[u] = 2;

			// Append node to topological ordering (reverse)
			topoOrder.push_back(u);

			return false;
		}

	} // namespace detail


	bool topologicalSort(const AdjacencyList& adjList, std::vector<int>& topoOrder)
	{
		const int nNodes = static_cast<int>(adjList.size());
		topoOrder.clear();
		topoOrder.reserve(nNodes);

		// Set color of each node to white (0)
		std::vector<char> colors(nNodes, 0);

		for (int u = 0; u < nNodes; ++u)
		{
			if (colors[u] != 0)
				continue;

			if (detail::topologicalSortHelper(adjList, u, colors, topoOrder))
				return true;
		}

		return false;
	}

} // namespace graph

} // namespace sequin
