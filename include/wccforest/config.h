#ifndef WCCFOREST_CONFIG_H_
#define WCCFOREST_CONFIG_H_

// Project version
#define WCCFOREST_VERSION_MAJOR 1
#define WCCFOREST_VERSION_MINOR 0
#define WCCFOREST_VERSION_PATCH 0
#define WCCFOREST_VERSION "1.0.0"

#endif // WCCFOREST_CONFIG_H_
