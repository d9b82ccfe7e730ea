//! # reqtree Driver Interface
//!
//! `reqtree_main()` dispatches to the appropriate command handler based on argv[1].

#pragma once

// Main driver entry point
int reqtree_main(int argc, char* argv[]);
