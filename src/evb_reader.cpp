#include "evbkit/evb_reader.hpp"
#include "evbkit/errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <zlib.h>

namespace evbkit {

// Large I/O buffer for gzip input
constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;

static bool command_exists(const char* cmd) {
    std::string check = "which " + std::string(cmd) + " > /dev/null 2>&1";
    return system(check.c_str()) == 0;
}

static bool ends_with(const std::string& s, const char* suffix) {
    const size_t n = strlen(suffix);
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

static std::vector<std::string> split_ws(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) tokens.push_back(tok);
    return tokens;
}

static bool parse_double(const std::string& tok, double& out) {
    if (tok.empty()) return false;
    errno = 0;
    char* end = nullptr;
    out = std::strtod(tok.c_str(), &end);
    return errno == 0 && end == tok.c_str() + tok.size();
}

static bool parse_int64(const std::string& tok, int64_t& out) {
    if (tok.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long v = std::strtoll(tok.c_str(), &end, 10);
    if (errno != 0 || end != tok.c_str() + tok.size()) return false;
    out = static_cast<int64_t>(v);
    return true;
}

class EvbReader::Impl {
public:
    std::string path_;
    std::ifstream file_;
    gzFile gz_file_ = nullptr;
    FILE* pipe_file_ = nullptr;  // pigz -dc
    bool is_gzipped_ = false;
    bool use_pigz_ = false;
    char buffer_[65536];
    size_t line_no_ = 0;
    std::string lookahead_line_;
    bool has_lookahead_ = false;

    bool open(const std::string& filename) {
        path_ = filename;
        if (ends_with(filename, ".gz")) {
            is_gzipped_ = true;

            // pigz for parallel decompression unless EVBKIT_NO_PIGZ is set;
            // EVBKIT_PIGZ_THREADS sets its thread count (default 4)
            const char* no_pigz = std::getenv("EVBKIT_NO_PIGZ");
            if (!no_pigz && command_exists("pigz")) {
                const char* threads_env = std::getenv("EVBKIT_PIGZ_THREADS");
                int threads = threads_env ? std::atoi(threads_env) : 4;
                if (threads < 1) threads = 4;
                std::string cmd = "pigz -dc -p " + std::to_string(threads) + " \"" + filename + "\"";
                // pigz would only report a missing file after popen succeeds
                FILE* probe = fopen(filename.c_str(), "rb");
                if (probe) {
                    fclose(probe);
                    pipe_file_ = popen(cmd.c_str(), "r");
                    if (pipe_file_) {
                        use_pigz_ = true;
                        setvbuf(pipe_file_, nullptr, _IOFBF, GZBUF_SIZE);
                        return true;
                    }
                }
            }

            use_pigz_ = false;
            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, GZBUF_SIZE);
            return true;
        }

        file_.open(filename);
        return static_cast<bool>(file_);
    }

    bool raw_getline(std::string& line) {
        if (is_gzipped_) {
            // CI_VECTOR lines of large systems exceed the buffer; keep
            // reading until the newline
            line.clear();
            bool got_any = false;
            while (true) {
                char* got = use_pigz_ ? fgets(buffer_, sizeof(buffer_), pipe_file_)
                                      : gzgets(gz_file_, buffer_, sizeof(buffer_));
                if (!got) break;
                got_any = true;
                size_t len = strlen(buffer_);
                const bool complete = len > 0 && buffer_[len - 1] == '\n';
                if (complete) len--;
                line.append(buffer_, len);
                if (complete) break;
            }
            if (!got_any) return false;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        if (!std::getline(file_, line)) return false;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    bool getline(std::string& line) {
        if (has_lookahead_) {
            line = std::move(lookahead_line_);
            has_lookahead_ = false;
            return true;
        }
        if (!raw_getline(line)) return false;
        ++line_no_;
        return true;
    }

    void push_back(std::string line) {
        lookahead_line_ = std::move(line);
        has_lookahead_ = true;
    }

    void close() {
        if (use_pigz_ && pipe_file_) {
            pclose(pipe_file_);
            pipe_file_ = nullptr;
        } else if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (file_.is_open()) file_.close();
    }

    [[noreturn]] void fail(size_t line, const std::string& detail) const {
        throw TrajectoryFormatError(path_, line, detail);
    }

    // "1" or "1:"
    int parse_complex(const std::vector<std::string>& tok, size_t line) const {
        if (tok.size() < 2) fail(line, tok[0] + " record without complex id");
        std::string c = tok[1];
        if (!c.empty() && c.back() == ':') c.pop_back();
        int64_t id = 0;
        if (!parse_int64(c, id)) fail(line, "invalid complex id '" + tok[1] + "'");
        return static_cast<int>(id);
    }

    ~Impl() {
        close();
    }
};

EvbReader::EvbReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->open(filename)) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
}

EvbReader::~EvbReader() = default;

size_t EvbReader::line_number() const {
    return impl_->line_no_;
}

bool EvbReader::is_gzipped() const {
    return impl_->is_gzipped_;
}

bool EvbReader::read_next(EvbRecord& record) {
    std::string line;
    while (impl_->getline(line)) {
        if (line.empty() || line[0] == '#') continue;
        const std::vector<std::string> tok = split_ws(line);
        if (tok.empty()) continue;

        const size_t at = impl_->line_no_;
        record = EvbRecord();
        record.line = at;

        if (tok[0] == "TIMESTEP") {
            if (tok.size() < 2 || !parse_int64(tok[1], record.timestep)) {
                impl_->fail(at, "invalid TIMESTEP record");
            }
            record.kind = EvbRecord::Kind::TIMESTEP;
            return true;
        }

        if (tok[0] == "RXNCENTER") {
            record.kind = EvbRecord::Kind::RXNCENTER;
            record.complex_id = impl_->parse_complex(tok, at);
            if (tok.size() < 3 || !parse_int64(tok[2], record.center)) {
                impl_->fail(at, "invalid RXNCENTER record");
            }
            return true;
        }

        if (tok[0] == "CI_VECTOR") {
            record.kind = EvbRecord::Kind::CI_VECTOR;
            record.complex_id = impl_->parse_complex(tok, at);
            for (size_t i = 2; i < tok.size(); ++i) {
                double c = 0.0;
                if (!parse_double(tok[i], c)) {
                    impl_->fail(at, "invalid CI coefficient '" + tok[i] + "'");
                }
                record.ci.push_back(c);
            }

            // Coefficients may wrap onto continuation lines
            std::string next;
            while (impl_->getline(next)) {
                const std::vector<std::string> more = split_ws(next);
                double c = 0.0;
                if (more.empty() || !parse_double(more[0], c)) {
                    impl_->push_back(std::move(next));
                    break;
                }
                for (const auto& t : more) {
                    if (!parse_double(t, c)) {
                        impl_->fail(impl_->line_no_, "invalid CI coefficient '" + t + "'");
                    }
                    record.ci.push_back(c);
                }
            }
            return true;
        }
    }
    return false;
}

TrajectoryColumns EvbReader::read_columns(int complex_id) {
    TrajectoryColumns cols;
    EvbRecord rec;
    while (read_next(rec)) {
        switch (rec.kind) {
            case EvbRecord::Kind::TIMESTEP:
                cols.timesteps.push_back(rec.timestep);
                break;
            case EvbRecord::Kind::RXNCENTER:
                if (rec.complex_id == complex_id) cols.centers.push_back(rec.center);
                break;
            case EvbRecord::Kind::CI_VECTOR:
                if (rec.complex_id == complex_id) {
                    cols.amplitude_vectors.push_back(std::move(rec.ci));
                }
                break;
        }
    }
    return cols;
}

TrajectoryColumns load_trajectory(const std::string& filename, int complex_id) {
    EvbReader reader(filename);
    TrajectoryColumns cols = reader.read_columns(complex_id);
    validate_columns(cols);
    return cols;
}

}  // namespace evbkit
