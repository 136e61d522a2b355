//! # sigdoc Entry Point
//!
//! All work happens in the CLI driver (`cli/driver.hpp`).
//!
//! ```bash
//! sigdoc normalize "typing.List[pkg.Widget]"   # List[Widget]
//! sigdoc params docstring.txt                  # name: description
//! sigdoc doc --style=google docstring.txt
//! ```

#include "cli/driver.hpp"

int main(int argc, char* argv[]) {
    return sigdoc_main(argc, argv);
}
