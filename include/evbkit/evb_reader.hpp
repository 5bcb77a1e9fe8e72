#pragma once

#include "evbkit/types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace evbkit {

/**
 * One record of a RAPTOR evb.out file that the analyses use.
 */
struct EvbRecord {
    enum class Kind { TIMESTEP, RXNCENTER, CI_VECTOR };

    Kind kind = Kind::TIMESTEP;
    size_t line = 0;             // 1-based line of the keyword
    int complex_id = 0;          // RXNCENTER / CI_VECTOR only
    Timestep timestep = 0;       // TIMESTEP only
    CenterId center = 0;         // RXNCENTER only
    std::vector<double> ci;      // CI_VECTOR only
};

/**
 * Streaming reader for evb.out (plain or gzip-compressed)
 *
 * Recognised lines:
 *   TIMESTEP <step>
 *   RXNCENTER <complex>[:] <center>
 *   CI_VECTOR <complex>[:] <c1> <c2> ...   (may continue on following lines)
 * Everything else is skipped.
 */
class EvbReader {
public:
    /**
     * Open a trajectory file; throws std::runtime_error if it cannot be read
     */
    explicit EvbReader(const std::string& filename);
    ~EvbReader();

    /**
     * Read the next record. Returns false at end of file.
     * Throws TrajectoryFormatError on a malformed record.
     */
    bool read_next(EvbRecord& record);

    /**
     * Collect frame-aligned columns for one complex
     */
    TrajectoryColumns read_columns(int complex_id = 1);

    size_t line_number() const;
    bool is_gzipped() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/**
 * Convenience: open, read and validate (validate_columns) in one call
 */
TrajectoryColumns load_trajectory(const std::string& filename, int complex_id = 1);

}  // namespace evbkit
