#pragma once

/**
 * Modulo operation that always returns a non-negative result, e.g.
 * mathematical_modulo(-1, 5) == 4. This is needed for wrapping menu
 * selections around.
 */
int mathematical_modulo(int number, int modulus);
