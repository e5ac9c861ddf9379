#ifndef VERSION_H_
#define VERSION_H_

#define STRINGIFY(x) #x
#define TOSTRING(x) STRINGIFY(x)

#define COMMIT_TAG "@VOXGATE_COMMIT_TAG@"
#define COMPILE_TIME __DATE__ " " __TIME__

#define VERSION "@PROJECT_VERSION@"
#define FULL_VERSION_STRING "voxgate v" VERSION " [" COMMIT_TAG "] " COMPILE_TIME

#endif   // VERSION_H_
