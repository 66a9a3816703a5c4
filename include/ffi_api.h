#pragma once
#include <cstdint>

#ifdef _WIN32
  #define MB_EXPORT __declspec(dllexport)
#else
  #define MB_EXPORT __attribute__((visibility("default")))
#endif

// C entry points for host-language training harnesses (ctypes / cffi).
// Grids are (n, rows, cols) row-major buffers owned by the caller.
extern "C" {
    MB_EXPORT void* ms_create(int rows, int cols, const int* hazards, int n, uint64_t seed);
    MB_EXPORT void ms_destroy(void* handle);
    MB_EXPORT const char* ms_last_error();

    MB_EXPORT int ms_batch_size(void* handle);
    MB_EXPORT int ms_active_count(void* handle);
    MB_EXPORT int ms_reset(void* handle, int redraw);

    MB_EXPORT int ms_move(void* handle, const uint8_t* reveal, const uint8_t* mark, uint8_t* out_accepted);
    MB_EXPORT int ms_open_zero(void* handle, uint8_t* out_opened);

    MB_EXPORT int ms_game_state(void* handle, int8_t* out);
    MB_EXPORT int ms_as_dataset(void* handle, int8_t* out);
    MB_EXPORT int ms_numbers(void* handle, int8_t* out);
    MB_EXPORT int ms_fatal_cells(void* handle, uint8_t* out);
    MB_EXPORT int ms_flags(void* handle, uint8_t* out_active, uint8_t* out_won);
    MB_EXPORT int ms_scores(void* handle, double* out);
    MB_EXPORT double ms_win_rate(void* handle);
}
