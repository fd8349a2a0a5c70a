// miniaudio 单头文件库的实现单元，整个工程只能有一处
#define MINIAUDIO_IMPLEMENTATION
#include <miniaudio.h>
