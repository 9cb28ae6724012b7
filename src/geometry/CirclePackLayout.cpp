#include "geometry/CirclePackLayout.h"
#include "core/Errors.h"

#include <algorithm>
#include <cmath>
#include <string>
#include <unordered_map>

namespace clustermap {

int PackedLayout::indexOf(const std::string& id) const {
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].node && nodes[i].node->id == id) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

const PackedNode* PackedLayout::find(const std::string& id) const {
    int idx = indexOf(id);
    return idx < 0 ? nullptr : &nodes[idx];
}

double CirclePackLayout::Lcg::next() {
    // Numerical Recipes constants, modulus 2^32
    static constexpr uint64_t A = 1664525u;
    static constexpr uint64_t C = 1013904223u;
    static constexpr uint64_t M = 4294967296u;
    state_ = (A * state_ + C) % M;
    return static_cast<double>(state_) / static_cast<double>(M);
}

// ============================================================================
// Enclosing circle
// ============================================================================

namespace {

// True unless a fully contains b
bool enclosesNot(const Circle& a, const Circle& b) {
    double dr = a.r - b.r;
    double dx = b.x - a.x;
    double dy = b.y - a.y;
    return dr < 0 || dr * dr < dx * dx + dy * dy;
}

// Containment with a relative tolerance
bool enclosesWeak(const Circle& a, const Circle& b) {
    double dr = a.r - b.r + std::max({a.r, b.r, 1.0}) * 1e-9;
    double dx = b.x - a.x;
    double dy = b.y - a.y;
    return dr > 0 && dr * dr > dx * dx + dy * dy;
}

bool enclosesWeakAll(const Circle& a, const std::vector<Circle>& basis) {
    for (const Circle& b : basis) {
        if (!enclosesWeak(a, b)) {
            return false;
        }
    }
    return true;
}

Circle encloseBasis2(const Circle& a, const Circle& b) {
    double x21 = b.x - a.x;
    double y21 = b.y - a.y;
    double r21 = b.r - a.r;
    double l = std::sqrt(x21 * x21 + y21 * y21);
    return Circle{(a.x + b.x + x21 / l * r21) / 2,
                  (a.y + b.y + y21 / l * r21) / 2,
                  (l + a.r + b.r) / 2};
}

Circle encloseBasis3(const Circle& a, const Circle& b, const Circle& c) {
    double x1 = a.x, y1 = a.y, r1 = a.r;
    double x2 = b.x, y2 = b.y, r2 = b.r;
    double x3 = c.x, y3 = c.y, r3 = c.r;
    double a2 = x1 - x2, a3 = x1 - x3;
    double b2 = y1 - y2, b3 = y1 - y3;
    double c2 = r2 - r1, c3 = r3 - r1;
    double d1 = x1 * x1 + y1 * y1 - r1 * r1;
    double d2 = d1 - x2 * x2 - y2 * y2 + r2 * r2;
    double d3 = d1 - x3 * x3 - y3 * y3 + r3 * r3;
    double ab = a3 * b2 - a2 * b3;
    double xa = (b2 * d3 - b3 * d2) / (ab * 2) - x1;
    double xb = (b3 * c2 - b2 * c3) / ab;
    double ya = (a3 * d2 - a2 * d3) / (ab * 2) - y1;
    double yb = (a2 * c3 - a3 * c2) / ab;
    double qa = xb * xb + yb * yb - 1;
    double qb = 2 * (r1 + xa * xb + ya * yb);
    double qc = xa * xa + ya * ya - r1 * r1;
    double r = -(std::abs(qa) > 1e-6 ? (qb + std::sqrt(qb * qb - 4 * qa * qc)) / (2 * qa)
                                     : qc / qb);
    return Circle{x1 + xa + xb * r, y1 + ya + yb * r, r};
}

Circle encloseBasis(const std::vector<Circle>& basis) {
    switch (basis.size()) {
        case 1: return basis[0];
        case 2: return encloseBasis2(basis[0], basis[1]);
        default: return encloseBasis3(basis[0], basis[1], basis[2]);
    }
}

std::vector<Circle> extendBasis(const std::vector<Circle>& basis, const Circle& p) {
    if (enclosesWeakAll(p, basis)) {
        return {p};
    }

    for (size_t i = 0; i < basis.size(); ++i) {
        if (enclosesNot(p, basis[i]) &&
            enclosesWeakAll(encloseBasis2(basis[i], p), basis)) {
            return {basis[i], p};
        }
    }

    for (size_t i = 0; i + 1 < basis.size(); ++i) {
        for (size_t j = i + 1; j < basis.size(); ++j) {
            if (enclosesNot(encloseBasis2(basis[i], basis[j]), p) &&
                enclosesNot(encloseBasis2(basis[i], p), basis[j]) &&
                enclosesNot(encloseBasis2(basis[j], p), basis[i]) &&
                enclosesWeakAll(encloseBasis3(basis[i], basis[j], p), basis)) {
                return {basis[i], basis[j], p};
            }
        }
    }

    throw LayoutError("CirclePackLayout: enclosing circle basis degenerated");
}

} // namespace

Circle CirclePackLayout::encloseCircles(std::vector<Circle> circles, Lcg& random) {
    // Fisher-Yates, driven by the layout's generator
    size_t m = circles.size();
    while (m > 0) {
        size_t i = static_cast<size_t>(random.next() * static_cast<double>(m));
        --m;
        std::swap(circles[m], circles[i]);
    }

    std::vector<Circle> basis;
    Circle e;
    bool haveEnclosure = false;
    size_t i = 0;
    while (i < circles.size()) {
        const Circle& p = circles[i];
        if (haveEnclosure && enclosesWeak(e, p)) {
            ++i;
        } else {
            basis = extendBasis(basis, p);
            e = encloseBasis(basis);
            haveEnclosure = true;
            i = 0;
        }
    }
    return e;
}

// ============================================================================
// Sibling packing (front chain)
// ============================================================================

namespace {

// Place c tangent to both a and b
void place(const Circle& b, const Circle& a, Circle& c) {
    double dx = b.x - a.x;
    double dy = b.y - a.y;
    double d2 = dx * dx + dy * dy;
    if (d2 > 0.0) {
        double a2 = sqr(a.r + c.r);
        double b2 = sqr(b.r + c.r);
        if (a2 > b2) {
            double x = (d2 + b2 - a2) / (2 * d2);
            double y = std::sqrt(std::max(0.0, b2 / d2 - x * x));
            c.x = b.x - x * dx - y * dy;
            c.y = b.y - x * dy + y * dx;
        } else {
            double x = (d2 + a2 - b2) / (2 * d2);
            double y = std::sqrt(std::max(0.0, a2 / d2 - x * x));
            c.x = a.x + x * dx - y * dy;
            c.y = a.y + x * dy + y * dx;
        }
    } else {
        c.x = a.x + c.r;
        c.y = a.y;
    }
}

bool intersects(const Circle& a, const Circle& b) {
    double dr = a.r + b.r - 1e-6;
    double dx = b.x - a.x;
    double dy = b.y - a.y;
    return dr > 0 && dr * dr > dx * dx + dy * dy;
}

// Doubly linked ring over circle indices
struct ChainLink {
    int circle;
    int next = -1;
    int prev = -1;
};

} // namespace

double CirclePackLayout::packSiblings(std::vector<Circle>& circles, Lcg& random) {
    const int n = static_cast<int>(circles.size());
    if (n == 0) {
        return 0.0;
    }

    // First circle at the origin
    circles[0].x = 0.0;
    circles[0].y = 0.0;
    if (n == 1) {
        return circles[0].r;
    }

    // Second circle to its right
    circles[0].x = -circles[1].r;
    circles[1].x = circles[0].r;
    circles[1].y = 0.0;
    if (n == 2) {
        return circles[0].r + circles[1].r;
    }

    // Third circle tangent to both
    place(circles[1], circles[0], circles[2]);

    std::vector<ChainLink> chain;
    chain.reserve(n);
    chain.push_back(ChainLink{0});
    chain.push_back(ChainLink{1});
    chain.push_back(ChainLink{2});
    int a = 0, b = 1, c = 2;
    chain[a].next = b; chain[c].prev = b;
    chain[b].next = c; chain[a].prev = c;
    chain[c].next = a; chain[b].prev = a;

    auto circleOf = [&](int link) -> Circle& { return circles[chain[link].circle]; };

    // Weighted centroid distance of the pair (link, link.next)
    auto score = [&](int link) {
        const Circle& ca = circleOf(link);
        const Circle& cb = circleOf(chain[link].next);
        double ab = ca.r + cb.r;
        double dx = (ca.x * cb.r + cb.x * ca.r) / ab;
        double dy = (ca.y * cb.r + cb.y * ca.r) / ab;
        return dx * dx + dy * dy;
    };

    for (int i = 3; i < n; ++i) {
        place(circleOf(a), circleOf(b), circles[i]);
        Circle& ci = circles[i];

        // Find the closest intersecting circle on the front chain, measured
        // by distance along the chain in either direction
        int j = chain[b].next;
        int k = chain[a].prev;
        double sj = circleOf(b).r;
        double sk = circleOf(a).r;
        bool retry = false;
        do {
            if (sj <= sk) {
                if (intersects(circleOf(j), ci)) {
                    b = j;
                    chain[a].next = b;
                    chain[b].prev = a;
                    retry = true;
                    break;
                }
                sj += circleOf(j).r;
                j = chain[j].next;
            } else {
                if (intersects(circleOf(k), ci)) {
                    a = k;
                    chain[a].next = b;
                    chain[b].prev = a;
                    retry = true;
                    break;
                }
                sk += circleOf(k).r;
                k = chain[k].prev;
            }
        } while (j != chain[k].next);

        if (retry) {
            --i;
            continue;
        }

        // Insert the new circle between a and b
        int link = static_cast<int>(chain.size());
        chain.push_back(ChainLink{i, b, a});
        chain[a].next = link;
        chain[b].prev = link;
        b = link;

        // New closest pair to the centroid
        double best = score(a);
        for (int cur = chain[b].next; cur != b; cur = chain[cur].next) {
            double s = score(cur);
            if (s < best) {
                a = cur;
                best = s;
            }
        }
        b = chain[a].next;
    }

    // Enclose the front chain and recentre everything on it
    std::vector<Circle> front{circleOf(b)};
    for (int cur = chain[b].next; cur != b; cur = chain[cur].next) {
        front.push_back(circleOf(cur));
    }
    Circle e = encloseCircles(std::move(front), random);

    for (Circle& circle : circles) {
        circle.x -= e.x;
        circle.y -= e.y;
    }
    return e.r;
}

// ============================================================================
// Full layout
// ============================================================================

PackedLayout CirclePackLayout::compute(ClusterNode* root, double width, double height,
                                       double padding) {
    PackedLayout layout;
    layout.width = width;
    layout.height = height;
    if (!root || width <= 0.0 || height <= 0.0) {
        return layout;
    }

    std::vector<PackedNode>& nodes = layout.nodes;

    // --- Pre-order flattening with children sorted by descending value ---

    struct Visitor {
        std::vector<PackedNode>& out;

        int64_t sumValue(ClusterNode* node, int depth) {
            if (depth > MAX_HIERARCHY_DEPTH) {
                throw LayoutError("CirclePackLayout: hierarchy deeper than " +
                                  std::to_string(MAX_HIERARCHY_DEPTH) + " levels");
            }
            int64_t value = node->packWeight();
            for (auto& child : node->children) {
                value += sumValue(child.get(), depth + 1);
            }
            values[node] = value;
            return value;
        }

        int flatten(ClusterNode* node, int depth, int parent) {
            int index = static_cast<int>(out.size());
            PackedNode packed;
            packed.node = node;
            packed.depth = depth;
            packed.value = values[node];
            packed.parent = parent;
            out.push_back(std::move(packed));

            std::vector<ClusterNode*> sorted;
            sorted.reserve(node->children.size());
            for (auto& child : node->children) {
                sorted.push_back(child.get());
            }
            std::stable_sort(sorted.begin(), sorted.end(),
                             [this](ClusterNode* a, ClusterNode* b) {
                                 return values[a] > values[b];
                             });

            for (ClusterNode* child : sorted) {
                int childIndex = flatten(child, depth + 1, index);
                out[index].children.push_back(childIndex);
            }
            return index;
        }

        std::unordered_map<ClusterNode*, int64_t> values;
    };

    Visitor visitor{nodes};
    visitor.sumValue(root, 0);
    visitor.flatten(root, 0, -1);

    // Post-order visiting sequence (children before parents)
    std::vector<int> postOrder;
    postOrder.reserve(nodes.size());
    {
        std::vector<int> stack{0};
        while (!stack.empty()) {
            int idx = stack.back();
            stack.pop_back();
            postOrder.push_back(idx);
            for (int child : nodes[idx].children) {
                stack.push_back(child);
            }
        }
        std::reverse(postOrder.begin(), postOrder.end());
    }

    Lcg random;

    // Leaf radius from value
    for (PackedNode& pn : nodes) {
        if (pn.children.empty()) {
            pn.r = std::sqrt(static_cast<double>(pn.value));
        }
    }

    auto packPass = [&](double pad) {
        std::vector<Circle> circles;
        for (int idx : postOrder) {
            PackedNode& parent = nodes[idx];
            if (parent.children.empty()) {
                continue;
            }
            circles.clear();
            for (int child : parent.children) {
                circles.push_back(Circle{0.0, 0.0, nodes[child].r + pad});
            }
            double e = packSiblings(circles, random);
            for (size_t c = 0; c < circles.size(); ++c) {
                PackedNode& child = nodes[parent.children[c]];
                child.x = circles[c].x;
                child.y = circles[c].y;
            }
            parent.r = e + pad;
        }
    };

    double minSide = std::min(width, height);

    // Unpadded pass establishes the root radius the padding is scaled by
    packPass(0.0);
    packPass(padding * nodes[0].r / minSide);

    // Scale into the box and convert child offsets to absolute positions
    double k = minSide / (2.0 * nodes[0].r);
    nodes[0].x = width / 2.0;
    nodes[0].y = height / 2.0;
    nodes[0].r *= k;
    for (size_t i = 1; i < nodes.size(); ++i) {
        PackedNode& pn = nodes[i];
        const PackedNode& parent = nodes[pn.parent];
        pn.r *= k;
        pn.x = parent.x + k * pn.x;
        pn.y = parent.y + k * pn.y;
    }

    return layout;
}

} // namespace clustermap
