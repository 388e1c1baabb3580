#pragma once
enum RetCode {
  kOk = 0,
  kNotFound,
  kAbort,
  kFatal,
};
