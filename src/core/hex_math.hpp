/**
 * Axial hex-grid helpers.
 *
 * Axial (q, r) maps to cube (x, z) = (q, r), y = -q - r. Distance is the
 * largest cube-coordinate difference.
 */

#ifndef STRAT_HEX_MATH_HPP
#define STRAT_HEX_MATH_HPP

#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <vector>

namespace strat {

struct HexCoord {
    int q = 0;
    int r = 0;

    bool operator==(const HexCoord& o) const { return q == o.q && r == o.r; }
    bool operator!=(const HexCoord& o) const { return !(*this == o); }
};

inline int hex_distance(const HexCoord& a, const HexCoord& b) {
    int dq = std::abs(a.q - b.q);
    int dr = std::abs(a.r - b.r);
    int ds = std::abs((-a.q - a.r) - (-b.q - b.r));
    return std::max({dq, dr, ds});
}

inline std::vector<HexCoord> hex_neighbors(const HexCoord& c) {
    static const int kDirections[6][2] = {
        {1, 0}, {1, -1}, {0, -1}, {-1, 0}, {-1, 1}, {0, 1}
    };
    std::vector<HexCoord> out;
    out.reserve(6);
    for (const auto& d : kDirections) {
        out.push_back({c.q + d[0], c.r + d[1]});
    }
    return out;
}

/** Every hex within n steps of center, center included (3n^2 + 3n + 1 hexes). */
inline std::vector<HexCoord> hexes_in_range(const HexCoord& center, int n) {
    if (n < 0) throw std::invalid_argument("hex range must be non-negative");
    std::vector<HexCoord> out;
    for (int dq = -n; dq <= n; dq++) {
        int lo = std::max(-n, -dq - n);
        int hi = std::min(n, -dq + n);
        for (int dr = lo; dr <= hi; dr++) {
            out.push_back({center.q + dq, center.r + dr});
        }
    }
    return out;
}

} // namespace strat

#endif // STRAT_HEX_MATH_HPP
