#pragma once

// Runs every test group. Returns true if all of them passed.
bool run_tests();
