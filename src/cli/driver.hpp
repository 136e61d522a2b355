//! # CLI Driver Interface
//!
//! `sigdoc_main()` dispatches to the command handler named by the first
//! non-logging argument.

#pragma once

int sigdoc_main(int argc, char* argv[]);
