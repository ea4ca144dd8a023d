// k-d tree over k-dimensional points, built balanced in one pass

#ifndef KDTREE_H
#define KDTREE_H

#include <algorithm>
#include <numeric>
#include <vector>
#include "spatialIndex.h"


// Structure to represent node of kd tree
struct KdNode
{
	int id;
	int axis;
	KdNode* left;
	KdNode* right;

	KdNode(int setId, int setAxis)
	:	id(setId), axis(setAxis), left(NULL), right(NULL)
	{}

	~KdNode()
	{
		delete left;
		delete right;
	}
};


class KdTree : public SpatialIndex
{
public:
	// points must be non-empty and share one dimensionality
	explicit KdTree(const Layer& points)
	: points_(points), dim_(points.empty() ? 0 : static_cast<int>(points.front().size())), root_(NULL)
	{
		std::vector<int> ids(points_.size());
		std::iota(ids.begin(), ids.end(), 0);
		root_ = buildRec(ids.begin(), ids.end(), 0);
	}

	~KdTree()
	{
		delete root_;
	}

	KdTree(const KdTree&) = delete;
	KdTree& operator=(const KdTree&) = delete;

	std::size_t size() const override { return points_.size(); }
	int dimension() const override { return dim_; }
	const Layer& points() const override { return points_; }

	std::vector<int> radiusSearch(const Point& target, double radius) const override
	{
		std::vector<int> ids;
		searchRec(target, root_, radius, radius * radius, ids);
		std::sort(ids.begin(), ids.end());
		return ids;
	}

	int depth() const { return depthRec(root_); }

private:
	// median split on axis = depth % k, so both subtrees differ by at most one node
	KdNode* buildRec(std::vector<int>::iterator first, std::vector<int>::iterator last, int depth)
	{
		if (first == last)
			return NULL;

		int axis = depth % dim_;
		std::vector<int>::iterator mid = first + (last - first) / 2;
		std::nth_element(first, mid, last, [this, axis](int a, int b) {
			return points_[a][axis] < points_[b][axis];
		});

		KdNode* node = new KdNode(*mid, axis);
		node->left = buildRec(first, mid, depth + 1);
		node->right = buildRec(mid + 1, last, depth + 1);
		return node;
	}

	void searchRec(const Point& target, const KdNode* node, double distTol, double distTolSq, std::vector<int>& ids) const
	{
		if (node == NULL)
			return;

		const Point& p = points_[node->id];
		if ((p - target).squaredNorm() <= distTolSq)
			ids.push_back(node->id);

		// equal keys may sit on either side of the median, so both bounds are inclusive
		double split = p[node->axis];
		if (target[node->axis] - distTol <= split)
			searchRec(target, node->left, distTol, distTolSq, ids);
		if (target[node->axis] + distTol >= split)
			searchRec(target, node->right, distTol, distTolSq, ids);
	}

	static int depthRec(const KdNode* node)
	{
		if (node == NULL)
			return 0;
		return 1 + std::max(depthRec(node->left), depthRec(node->right));
	}

	Layer points_;
	int dim_;
	KdNode* root_;
};

#endif // KDTREE_H
