#ifndef BREPCORE_INDEX_TOLERANCE_HPP
#define BREPCORE_INDEX_TOLERANCE_HPP

namespace brep {

// Absolute distance thresholds used by geometric predicates.
// Lengths are in model units (millimetres).
struct ToleranceConfig {
    // Two computed points closer than this are the same point
    double vertex_pulling = 0.001;  // one micrometer

    double vertex_pulling_sq() const {
        return vertex_pulling * vertex_pulling;
    }

    static ToleranceConfig micrometer() {
        return ToleranceConfig{
            .vertex_pulling = 0.001
        };
    }
};

}  // namespace brep

#endif // BREPCORE_INDEX_TOLERANCE_HPP
