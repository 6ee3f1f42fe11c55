#pragma once

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef struct sl_experiment_config {
  const uint64_t* sizes;   // NULL or sizes_len == 0 -> default sizes
  int sizes_len;
  int trials;              // <= 0 -> 3
  uint64_t seed;
  const char** algos;      // NULL or algos_len == 0 -> all algorithms
  int algos_len;
  uint64_t quadratic_cap;  // 0 -> 1024
  int verify;
} sl_experiment_config;

// Run a measurement (no files, no progress output) and return the results
// as CSV with header. Returns a malloc-allocated string; caller frees via
// sl_free. On error, returns NULL and sets *err_out (also needs sl_free).
char* sl_run_csv(const sl_experiment_config* cfg, char** err_out);

// Same as sl_run_csv but formatted as a JSON array.
char* sl_run_json(const sl_experiment_config* cfg, int pretty, char** err_out);

// Returns a JSON array of {"name","stable"} objects. Caller frees via sl_free.
char* sl_list_algos_json(char** err_out);

void sl_free(char* p);

#ifdef __cplusplus
}
#endif
