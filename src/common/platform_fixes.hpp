#pragma once

// 日志等级枚举与部分系统头文件中的宏同名 (ERROR, DEBUG ...)，统一在此处取消定义

#ifdef ERROR
#undef ERROR
#endif
#ifdef WARNING
#undef WARNING
#endif
#ifdef INFO
#undef INFO
#endif
#ifdef DEBUG
#undef DEBUG
#endif
#ifdef FATAL
#undef FATAL
#endif
#ifdef TRACE
#undef TRACE
#endif
