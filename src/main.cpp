//! # Kite Entry Point
//!
//! Delegates to the CLI driver.
//!
//! ```bash
//! kite                     # interactive session
//! kite -e "1 + 2 * 3"      # evaluate one input
//! kite script.kite         # run a script line by line
//! ```

#include "kite/cli/driver.hpp"

int main(int argc, char* argv[]) {
    return kite::cli::kite_main(argc, argv);
}
