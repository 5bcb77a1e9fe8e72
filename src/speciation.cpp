#include "evbkit/speciation.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iomanip>
#include <ostream>

namespace evbkit {

SpeciesFractions carbonate_fractions(double ph, double ka1, double ka2) {
    const double h = std::pow(10.0, -ph);
    const double denom = h * h + h * ka1 + ka1 * ka2;

    SpeciesFractions f;
    f.ph = ph;
    f.h2co3 = h * h / denom;
    f.hco3 = h * ka1 / denom;
    f.co3 = ka1 * ka2 / denom;
    return f;
}

static std::vector<SpeciesFractions> evaluate_sorted(std::vector<double> phs,
                                                     const AcidConstants& k) {
    std::sort(phs.begin(), phs.end());
    std::vector<SpeciesFractions> rows;
    rows.reserve(phs.size());
    for (double ph : phs) {
        rows.push_back(carbonate_fractions(ph, k.ka1, k.ka2));
    }
    return rows;
}

std::vector<SpeciesFractions> speciation_curve(const AcidConstants& k) {
    std::vector<double> phs;
    for (int i = 0; i <= 140; ++i) {
        phs.push_back(0.1 * i);
    }
    phs.push_back(k.pka1);
    phs.push_back(k.pka2);
    return evaluate_sorted(phs, k);
}

std::vector<SpeciesFractions> report_points(const AcidConstants& k) {
    std::vector<double> phs;
    for (int i = 1; i <= 14; ++i) {
        phs.push_back(static_cast<double>(i));
    }
    phs.push_back(k.pka1);
    phs.push_back(k.pka2);
    return evaluate_sorted(phs, k);
}

void print_speciation_table(std::ostream& out, const std::vector<SpeciesFractions>& rows) {
    char buf[96];
    out << "\n";
    out << "   pH   H2CO3    HCO3^-  CO3^{2-}\n";
    for (const auto& r : rows) {
        std::snprintf(buf, sizeof(buf), "%6.3f %8.6f %8.6f %8.6f", r.ph, r.h2co3, r.hco3, r.co3);
        out << buf << "\n";
    }
    out << "\n";
}

void write_speciation_tsv(std::ostream& out, const std::vector<SpeciesFractions>& rows) {
    out << "pH\tH2CO3\tHCO3\tCO3\n";
    out << std::fixed;
    for (const auto& r : rows) {
        out << std::setprecision(3) << r.ph
            << '\t' << std::setprecision(8) << r.h2co3
            << '\t' << std::setprecision(8) << r.hco3
            << '\t' << std::setprecision(8) << r.co3 << '\n';
    }
}

}  // namespace evbkit
