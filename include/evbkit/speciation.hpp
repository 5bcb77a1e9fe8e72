#pragma once
// Carbonic acid speciation from the Henderson-Hasselbalch relations.
//
// With h = [H3O+] = 10^-pH and D = h^2 + h*Ka1 + Ka1*Ka2:
//   f(H2CO3) = h^2 / D,  f(HCO3-) = h*Ka1 / D,  f(CO3^2-) = Ka1*Ka2 / D

#include <iosfwd>
#include <vector>

namespace evbkit {

struct AcidConstants {
    double ka1 = 3.54e-4;
    double ka2 = 4.69e-11;
    double pka1 = 3.45;
    double pka2 = 10.329;
};

struct SpeciesFractions {
    double ph = 0.0;
    double h2co3 = 0.0;
    double hco3 = 0.0;
    double co3 = 0.0;
};

SpeciesFractions carbonate_fractions(double ph, double ka1, double ka2);

// pH 0.0 to 14.0 in steps of 0.1, plus pKa1 and pKa2, ascending.
std::vector<SpeciesFractions> speciation_curve(const AcidConstants& k = AcidConstants());

// pH 1..14 plus pKa1 and pKa2, ascending.
std::vector<SpeciesFractions> report_points(const AcidConstants& k = AcidConstants());

void print_speciation_table(std::ostream& out, const std::vector<SpeciesFractions>& rows);

void write_speciation_tsv(std::ostream& out, const std::vector<SpeciesFractions>& rows);

}  // namespace evbkit
