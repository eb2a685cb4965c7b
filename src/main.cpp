//! # smlc Entry Point
//!
//! ## Usage
//!
//! ```bash
//! smlc shapes.sml               # print the tree and its reduced form
//! smlc --tokens shapes.sml      # also dump the token stream
//! smlc --sync-scan -vv a.sml    # scan on the main thread, debug logging
//! ```
//!
//! All work happens in `sml_main()` (`cli/driver.cpp`).

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return sml_main(argc, argv);
}
