//! # smlc Driver Interface
//!
//! `sml_main()` parses the command line, loads each document, and prints
//! its tree before and after reduction.

#pragma once

// Main driver entry point
int sml_main(int argc, char* argv[]);
