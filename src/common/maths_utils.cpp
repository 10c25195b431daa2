#include "maths_utils.hpp"

int mathematical_modulo(int number, int modulus)
{
        return ((number % modulus) + modulus) % modulus;
}
