#pragma once

// 기본 FIM 설정파일 (환경변수 FIM_CONFIG_PATH로 대체 가능)
#define PATH_FIM_CONFIG_YAML      "/etc/fimguard/fim_config.yaml"

// 베이스라인 DB 경로 (환경변수 FIM_DATABASE_PATH로 대체 가능)
#define PATH_BASELINE_DB          "/var/lib/fimguard/fim_baseline.db"

// 로그 파일 경로 (환경변수 FIM_LOG_FILE로 대체 가능)
#define PATH_FIM_LOG              "/var/log/fimguard.log"

// 환경변수 이름
#define ENV_FIM_CONFIG_PATH       "FIM_CONFIG_PATH"
#define ENV_FIM_DATABASE_PATH     "FIM_DATABASE_PATH"
#define ENV_FIM_LOG_FILE          "FIM_LOG_FILE"
