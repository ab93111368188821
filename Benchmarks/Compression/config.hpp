#pragma once
#include <string>
#include <vector>

const int IterationTimes = 5;

const bool Verbose = false;

// number of input symbols per run
const std::vector<int> InputSizes = {
    1 << 10,
    1 << 14,
    1 << 18,
    1 << 20
};

const std::string InputSymbolsText = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789 .,";

// skewed alphabet, roughly the letter distribution of English text
const std::string InputSymbolsSkewed = "eeeeeeeeeeeetttttttttaaaaaaaaoooooooiiiiiiinnnnnnnsssssshhhhhhrrrrrdddlllcuumwfgypbvk  ";
