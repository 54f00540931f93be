#include "network_io.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

std::string trim(const std::string& s)
{
    const char* whitespace = " \t\r\n";
    size_t begin = s.find_first_not_of(whitespace);
    if (begin == std::string::npos)
    {
        return "";
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

// Splits one CSV record. Double-quoted fields may hold commas, and a doubled
// quote inside them stands for one quote character. Unquoted fields are trimmed.
std::vector<std::string> split_csv_line(const std::string& line)
{
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;
    bool was_quoted = false;

    for (size_t i = 0; i < line.size(); i++)
    {
        char c = line[i];
        if (in_quotes)
        {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"')
            {
                field += '"';
                i++;
            }
            else if (c == '"')
            {
                in_quotes = false;
            }
            else
            {
                field += c;
            }
        }
        else if (c == '"' && trim(field).empty())
        {
            in_quotes = true;
            was_quoted = true;
            field.clear();
        }
        else if (c == ',')
        {
            fields.push_back(was_quoted ? field : trim(field));
            field.clear();
            was_quoted = false;
        }
        else if (!was_quoted)
        {
            field += c;
        }
    }
    fields.push_back(was_quoted ? field : trim(field));
    return fields;
}

std::string csv_field(const std::string& value)
{
    if (value.find_first_of(",\"\n") == std::string::npos)
    {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value)
    {
        if (c == '"')
        {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

bool load_proteins(const std::string& filename, std::vector<std::string>& proteins)
{
    std::ifstream infile(filename);
    if (!infile)
    {
        std::cerr << "Error: Cannot open proteins file: " << filename << std::endl;
        return false;
    }

    proteins.clear();
    std::string line;
    while (std::getline(infile, line))
    {
        std::string protein = trim(line);
        if (!protein.empty())
        {
            proteins.push_back(protein);
        }
    }

    std::cout << "Loaded " << proteins.size() << " proteins from " << filename << std::endl;
    return true;
}

bool load_compartments(const std::string& filename, CompartmentMap& compartments)
{
    std::ifstream infile(filename);
    if (!infile)
    {
        std::cerr << "Error: Cannot open compartments file: " << filename << std::endl;
        return false;
    }

    std::string header;
    if (!std::getline(infile, header))
    {
        std::cerr << "Error: Could not read header from compartments file: " << filename << std::endl;
        return false;
    }

    std::vector<std::string> columns = split_csv_line(header);
    int protein_col = -1;
    int compartment_col = -1;
    for (size_t i = 0; i < columns.size(); i++)
    {
        if (columns[i] == "protein_id") protein_col = static_cast<int>(i);
        if (columns[i] == "compartment_id") compartment_col = static_cast<int>(i);
    }
    if (protein_col < 0 || compartment_col < 0)
    {
        std::cerr << "Error: Compartments file " << filename
                  << " must have 'protein_id' and 'compartment_id' columns, got header: " << header << std::endl;
        return false;
    }

    compartments.clear();
    std::string line;
    size_t line_no = 1;
    size_t duplicates = 0;
    size_t unassigned = 0;
    size_t needed = static_cast<size_t>(std::max(protein_col, compartment_col)) + 1;
    while (std::getline(infile, line))
    {
        line_no++;
        if (trim(line).empty())
        {
            continue;
        }

        std::vector<std::string> fields = split_csv_line(line);
        if (fields.size() < needed)
        {
            std::cerr << "Error: Expected at least " << needed << " fields at line " << line_no
                      << " of " << filename << ", got " << fields.size() << std::endl;
            compartments.clear();
            return false;
        }

        const std::string& protein = fields[protein_col];
        if (protein.empty())
        {
            std::cerr << "Error: Empty protein_id at line " << line_no << " of " << filename << std::endl;
            compartments.clear();
            return false;
        }

        // An empty compartment_id is no assignment at all.
        const std::string& compartment = fields[compartment_col];
        if (compartment.empty())
        {
            unassigned++;
            if (compartments.erase(protein) != 0)
            {
                duplicates++;
            }
            continue;
        }

        auto it = compartments.find(protein);
        if (it != compartments.end())
        {
            duplicates++;
            it->second = compartment;
        }
        else
        {
            compartments.emplace(protein, compartment);
        }
    }

    if (duplicates > 0)
    {
        std::cerr << "Warning: " << duplicates << " duplicate protein_id rows in " << filename
                  << " (last assignment kept)." << std::endl;
    }
    if (unassigned > 0)
    {
        std::cerr << "Warning: " << unassigned << " rows in " << filename
                  << " have an empty compartment_id; those proteins have no compartment." << std::endl;
    }

    std::cout << "Loaded " << compartments.size() << " compartment assignments from " << filename << std::endl;
    return true;
}

bool load_interactions(const std::string& filename, std::vector<ProteinPair>& interactions)
{
    std::ifstream infile(filename);
    if (!infile)
    {
        std::cerr << "Error: Cannot open interactions file: " << filename << std::endl;
        return false;
    }

    interactions.clear();
    std::string line;
    size_t line_no = 0;
    while (std::getline(infile, line))
    {
        line_no++;
        std::istringstream iss(line);
        std::string a, b, extra;
        if (!(iss >> a))
        {
            continue; // blank line
        }
        if (!(iss >> b))
        {
            std::cerr << "Error: Missing second protein at line " << line_no << " of " << filename << std::endl;
            interactions.clear();
            return false;
        }
        if (iss >> extra)
        {
            std::cerr << "Error: Unexpected extra field '" << extra << "' at line " << line_no
                      << " of " << filename << std::endl;
            interactions.clear();
            return false;
        }
        interactions.emplace_back(a, b);
    }

    std::cout << "Loaded " << interactions.size() << " interactions from " << filename << std::endl;
    return true;
}

bool write_pair_table(const std::string& filename, const std::vector<JoinedPair>& rows)
{
    std::ofstream out(filename);
    if (!out)
    {
        std::cerr << "Error: Cannot open output file: " << filename << std::endl;
        return false;
    }

    out << "protein_A,protein_B,compartment_A,compartment_B,group_A,group_B\n";
    for (const auto& row : rows)
    {
        out << csv_field(row.protein_A) << ',' << csv_field(row.protein_B) << ','
            << (row.compartment_A ? csv_field(*row.compartment_A) : "") << ','
            << (row.compartment_B ? csv_field(*row.compartment_B) : "") << ',';
        if (row.group_A) out << *row.group_A;
        out << ',';
        if (row.group_B) out << *row.group_B;
        out << '\n';
    }

    out.flush();
    if (!out)
    {
        std::cerr << "Error: Failed while writing " << filename << std::endl;
        return false;
    }
    std::cout << "Wrote " << rows.size() << " rows to " << filename << std::endl;
    return true;
}
