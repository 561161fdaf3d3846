#pragma once
#include "ewas.hpp"
#include <map>
#include <string>
#include <vector>

namespace ewas {

// ------------------ text helpers ------------------
bool ieq(const std::string& a, const std::string& b);
std::string trim(const std::string& s);
std::vector<std::string> split_simple(const std::string& s, char delim);
char detect_delimiter(const std::string& header_line);   // tab if present, else comma
bool is_missing(const std::string& s);                    // "", NA, NaN, NULL
bool looks_numeric(const std::string& s);                 // missing counts as numeric
double parse_double(const std::string& s);                // missing -> NaN; throws on junk
void ensure_parent_dir(const std::string& path);

// ------------------ inputs ------------------

// Sites x samples TSV. The header lists the sample ids, with or without a
// leading cell for the site-id column.
MethylationMatrix read_methylation_matrix(const std::string& path);

// Sample-sheet column names. Empty strings mean "not supplied".
struct SampleColumns {
  std::string id{"id"};
  std::string variable;
  std::vector<std::string> covariates;
  std::string batch;
  std::string cell_counts;
  std::string weights;                                      // one per sample
  std::vector<std::string> variable_levels;                 // makes the variable ordered
  std::map<std::string, std::vector<std::string>> ordered_levels;  // per covariate
};

// Reads the sheet and aligns its rows to the matrix columns by sample id.
// A matrix column without a sheet row throws std::invalid_argument.
EwasInput read_sample_sheet(const std::string& path,
                            const SampleColumns& cols,
                            MethylationMatrix beta);

// ------------------ outputs ------------------

// Writes per-set tables, p-value and coefficient matrices, outlier
// coordinates and a JSON summary. Returns the paths written.
std::vector<std::string> write_results(const EwasResult& res, const std::string& out_prefix);

} // namespace ewas
