#include "glv_em.hpp"
#include <iostream>
#include <string>

// Usage: fit_from_json <counts.json> <result.json> [config.json]
//
// counts.json: {"taxa": [...], "counts": [[taxon 1 across samples], ...]}
int
main(int argc, char **argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <counts.json> <result.json> [config.json]" << '\n';
        return 2;
    }
    const std::string counts_path = argv[1];
    const std::string result_path = argv[2];

    try {
        glv_em::EMConfig config;
        if (argc > 3) { config = glv_em::config_from_json(glv_em::read_json_file(argv[3])); }

        const glv_em::CountTable table = glv_em::count_table_from_json(glv_em::read_json_file(counts_path));
        std::cout << "Loaded " << table.num_taxa() << " taxa x " << table.num_samples() << " samples from "
                  << counts_path << '\n';

        const glv_em::EMResult result = glv_em::fit_glv_em(table, config);
        glv_em::write_json_file(glv_em::result_to_json(result), result_path);

        std::cout << "Termination: " << glv_em::to_string(result.termination) << " after " << result.iterations
                  << " iterations; " << result.excluded_samples.size() << " sample(s) excluded." << '\n';
        std::cout << "Result written to " << result_path << '\n';
        if (!result.converged) { return 3; }
    } catch (const glv_em::TaxonFitError &e) {
        std::cerr << "Some taxa could not be fitted: " << e.what() << '\n';
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
